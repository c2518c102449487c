#pragma once

#include <string>
#include <vector>

#include "core/DataStructs.hpp"

namespace TrinucMatrix {

/**
 * @brief Variants loaded from a MAF file, split the way downstream expects.
 *
 * Rows with a silent Variant_Classification (see is_silent_classification)
 * go into the silent pool; everything else into the main table. The
 * preparer decides whether the pool is merged back.
 */
class MafTable {
public:
    /**
     * @brief Appends a variant to the main table or the silent pool.
     */
    void add_variant(const Variant& variant);

    size_t size() const { return variants_.size(); }
    size_t silent_size() const { return silent_.size(); }

    const std::vector<Variant>& all() const { return variants_; }
    const std::vector<Variant>& silent() const { return silent_; }

    /**
     * @brief Rows skipped because a required field could not be parsed.
     */
    size_t skipped_rows() const { return skipped_rows_; }

    /**
     * @brief Loads a tab-delimited MAF (plain, gzip or bgzip) through htslib.
     *
     * Lines starting with '#' are comments. The first other line is the
     * header; columns are located by name. End_Position is optional and
     * defaults to Start_Position.
     *
     * @return false if the file cannot be opened or a required column is missing.
     */
    bool load_from_maf(const std::string& maf_path);

private:
    std::vector<Variant> variants_;
    std::vector<Variant> silent_;
    size_t skipped_rows_ = 0;
};

}  // namespace TrinucMatrix
