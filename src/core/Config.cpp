#include "core/Config.hpp"

#include <htslib/faidx.h>
#include <htslib/hts.h>

#include <filesystem>
#include <iostream>

namespace TrinucMatrix {

bool Config::validate() const {
    bool valid = true;

    if (maf_path.empty()) {
        std::cerr << "Error: MAF path is required." << std::endl;
        valid = false;
    } else {
        htsFile* fp = hts_open(maf_path.c_str(), "r");
        if (fp == NULL) {
            std::cerr << "Error: Cannot open MAF file: " << maf_path << std::endl;
            valid = false;
        } else {
            hts_close(fp);
        }
    }

    if (reference_fasta_path.empty()) {
        std::cerr << "Error: Reference FASTA path is required." << std::endl;
        valid = false;
    } else {
        // Verify FASTA index (.fai)
        faidx_t* fai = fai_load(reference_fasta_path.c_str());
        if (fai == NULL) {
            std::cerr << "Error: Cannot load Reference FASTA (or .fai index missing): " << reference_fasta_path
                      << std::endl;
            valid = false;
        } else {
            if (faidx_nseq(fai) == 0) {
                std::cerr << "Error: Reference FASTA has no sequences: " << reference_fasta_path << std::endl;
                valid = false;
            }
            fai_destroy(fai);
        }
    }

    if (output_dir.empty()) {
        std::cerr << "Error: Output directory must not be empty." << std::endl;
        valid = false;
    }

    if (confidence_level <= 0.0 || confidence_level >= 1.0) {
        std::cerr << "Error: confidence_level must be between 0.0 and 1.0 (exclusive)." << std::endl;
        valid = false;
    }

    if (threads <= 0) {
        std::cerr << "Error: threads must be positive." << std::endl;
        valid = false;
    }

    if (prefix_mode == PrefixMode::REMOVE && contig_prefix.empty()) {
        std::cerr << "Warning: prefix mode 'remove' has no effect without --prefix." << std::endl;
    }

    return valid;
}

std::string Config::get_output_basename() const {
    if (!output_basename.empty()) {
        return output_basename;
    }

    std::string name = std::filesystem::path(maf_path).filename().string();
    for (const std::string ext : {".gz", ".bgz", ".maf", ".tsv", ".txt"}) {
        if (name.size() > ext.size() && name.compare(name.size() - ext.size(), ext.size(), ext) == 0) {
            name.erase(name.size() - ext.size());
        }
    }
    return name.empty() ? "trinuc_matrix" : name;
}

void Config::print() const {
    std::cout << "--- Configuration ---" << std::endl;
    std::cout << "MAF: " << maf_path << std::endl;
    std::cout << "Reference: " << reference_fasta_path << std::endl;
    std::cout << "Output Dir: " << output_dir << std::endl;
    std::cout << "Output Basename: " << get_output_basename() << std::endl;
    std::cout << "Contig Prefix: " << (contig_prefix.empty() ? "None" : contig_prefix + " (" +
                                                                           prefix_mode_to_string(prefix_mode) + ")")
              << std::endl;
    std::cout << "Ignored Contigs: ";
    if (ignore_contigs.empty()) {
        std::cout << "None";
    }
    for (size_t i = 0; i < ignore_contigs.size(); ++i) {
        std::cout << (i > 0 ? ", " : "") << ignore_contigs[i];
    }
    std::cout << std::endl;
    std::cout << "Use Synonymous: " << (use_syn ? "yes" : "no") << std::endl;
    std::cout << "Confidence Level: " << confidence_level << std::endl;
    std::cout << "Threads: " << threads << std::endl;
    std::cout << "---------------------" << std::endl;
}

} // namespace TrinucMatrix
