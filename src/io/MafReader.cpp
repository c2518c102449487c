#include "io/MafReader.hpp"

#include <htslib/hts.h>
#include <htslib/kstring.h>

#include <cstdlib>
#include <map>
#include <sstream>

#include "core/VariantPreparer.hpp"
#include "utils/Logger.hpp"

namespace TrinucMatrix {

namespace {

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream iss(line);
    while (std::getline(iss, field, '\t')) {
        fields.push_back(field);
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == '\t') {
        fields.emplace_back();
    }
    return fields;
}

bool parse_position(const std::string& text, int64_t& value) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || v < 1) {
        return false;
    }
    value = static_cast<int64_t>(v);
    return true;
}

}  // namespace

void MafTable::add_variant(const Variant& variant) {
    if (is_silent_classification(variant.variant_classification)) {
        silent_.push_back(variant);
    } else {
        variants_.push_back(variant);
    }
}

bool MafTable::load_from_maf(const std::string& maf_path) {
    Utils::Logger::info("Loading variants from MAF: " + maf_path);

    htsFile* fp = hts_open(maf_path.c_str(), "r");
    if (!fp) {
        Utils::Logger::error("Failed to open MAF file: " + maf_path);
        return false;
    }

    static const std::vector<std::string> required = {
        "Tumor_Sample_Barcode", "Chromosome",     "Start_Position",        "Reference_Allele",
        "Tumor_Seq_Allele2",    "Variant_Type",   "Variant_Classification"};

    kstring_t str = {0, 0, nullptr};
    std::map<std::string, size_t> col;
    bool header_seen = false;
    bool ok = true;
    size_t line_no = 0;
    size_t loaded = 0;

    while (hts_getline(fp, KS_SEP_LINE, &str) >= 0) {
        ++line_no;
        std::string line(str.s, str.l);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::vector<std::string> fields = split_tabs(line);

        if (!header_seen) {
            for (size_t i = 0; i < fields.size(); ++i) {
                col.emplace(fields[i], i);
            }
            for (const auto& name : required) {
                if (col.find(name) == col.end()) {
                    Utils::Logger::error("MAF header is missing required column '" + name + "': " + maf_path);
                    ok = false;
                }
            }
            if (!ok) {
                break;
            }
            header_seen = true;
            continue;
        }

        auto field = [&](const std::string& name) -> std::string {
            auto it = col.find(name);
            if (it == col.end() || it->second >= fields.size()) {
                return "";
            }
            return fields[it->second];
        };

        Variant v;
        v.sample_id = field("Tumor_Sample_Barcode");
        v.contig = field("Chromosome");
        v.reference_allele = field("Reference_Allele");
        v.alternate_allele = field("Tumor_Seq_Allele2");
        v.variant_type = field("Variant_Type");
        v.variant_classification = field("Variant_Classification");

        if (!parse_position(field("Start_Position"), v.position)) {
            Utils::Logger::debug("Skipping MAF line " + std::to_string(line_no) + ": invalid Start_Position");
            skipped_rows_++;
            continue;
        }
        if (!parse_position(field("End_Position"), v.end_position)) {
            v.end_position = v.position;
        }

        add_variant(v);
        loaded++;
    }

    free(str.s);
    if (hts_close(fp) != 0) {
        Utils::Logger::warning("Error while closing MAF file: " + maf_path);
    }

    if (ok && !header_seen) {
        Utils::Logger::error("MAF file has no header line: " + maf_path);
        ok = false;
    }
    if (!ok) {
        return false;
    }

    Utils::Logger::info("Finished loading MAF. Loaded: " + std::to_string(loaded) + " (main " +
                        std::to_string(variants_.size()) + ", silent " + std::to_string(silent_.size()) +
                        "), Skipped: " + std::to_string(skipped_rows_));
    return true;
}

}  // namespace TrinucMatrix
