#include "core/SequenceProvider.hpp"

#include <algorithm>
#include <cctype>

namespace TrinucMatrix {

void InMemorySequenceProvider::add_contig(const std::string& name, const std::string& sequence) {
    std::string upper = sequence;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    contigs_[name] = std::move(upper);
}

std::string InMemorySequenceProvider::get_sequence(const std::string& contig, int64_t start, int64_t end) const {
    auto it = contigs_.find(contig);
    if (it == contigs_.end()) {
        return "";
    }

    const std::string& seq = it->second;
    const int64_t len = static_cast<int64_t>(seq.size());
    if (start < 1 || end < start || start > len) {
        return "";
    }
    end = std::min(end, len);
    return seq.substr(static_cast<size_t>(start - 1), static_cast<size_t>(end - start + 1));
}

std::set<std::string> InMemorySequenceProvider::list_contigs() const {
    std::set<std::string> names;
    for (const auto& kv : contigs_) {
        names.insert(kv.first);
    }
    return names;
}

int64_t InMemorySequenceProvider::contig_length(const std::string& contig) const {
    auto it = contigs_.find(contig);
    if (it == contigs_.end()) {
        return -1;
    }
    return static_cast<int64_t>(it->second.size());
}

}  // namespace TrinucMatrix
