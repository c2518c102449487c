#include "utils/FastaReader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace TrinucMatrix {

FastaReader::FastaReader(const std::string& fasta_path)
    : fasta_path_(fasta_path), fai_(nullptr) {
    fai_ = fai_load(fasta_path.c_str());
    if (!fai_) {
        throw std::runtime_error("Failed to load FASTA index: " + fasta_path + ".fai");
    }
}

FastaReader::~FastaReader() {
    if (fai_) {
        fai_destroy(fai_);
    }
}

FastaReader::FastaReader(FastaReader&& other) noexcept
    : fasta_path_(std::move(other.fasta_path_)),
      fai_(other.fai_) {
    other.fai_ = nullptr;
}

FastaReader& FastaReader::operator=(FastaReader&& other) noexcept {
    if (this != &other) {
        if (fai_) {
            fai_destroy(fai_);
        }
        fasta_path_ = std::move(other.fasta_path_);
        fai_ = other.fai_;
        other.fai_ = nullptr;
    }
    return *this;
}

std::string FastaReader::get_sequence(const std::string& contig, int64_t start, int64_t end) const {
    if (!fai_ || start < 1 || end < start) {
        return "";
    }
    if (!faidx_has_seq(fai_, contig.c_str())) {
        return "";
    }

    // faidx takes 0-based inclusive coordinates and truncates at the contig end
    hts_pos_t len = 0;
    char* seq = faidx_fetch_seq64(fai_, contig.c_str(), start - 1, end - 1, &len);

    if (!seq || len <= 0) {
        if (seq) free(seq);
        return "";
    }

    std::string result(seq, static_cast<size_t>(len));
    free(seq);

    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    return result;
}

std::set<std::string> FastaReader::list_contigs() const {
    std::set<std::string> names;
    if (!fai_) {
        return names;
    }
    const int n = faidx_nseq(fai_);
    for (int i = 0; i < n; ++i) {
        names.insert(faidx_iseq(fai_, i));
    }
    return names;
}

int64_t FastaReader::contig_length(const std::string& contig) const {
    if (!fai_ || !faidx_has_seq(fai_, contig.c_str())) {
        return -1;
    }
    return faidx_seq_len(fai_, contig.c_str());
}

} // namespace TrinucMatrix
