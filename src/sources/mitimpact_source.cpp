/**
 * MitImpact Annotation Source
 *
 * Provides pathogenicity predictions and clinical reports for
 * mitochondrial coding variants from a local MitImpact export.
 */

#include "annotation_sources.hpp"
#include "file_parsers.hpp"
#include <algorithm>

namespace mtvep {

std::vector<std::string> mitimpact_default_fields() {
    return {
        "APOGEE_boost_consensus",
        "MToolBox",
        "Mitomap_Phenotype",
        "Mitomap_Status",
        "OXPHOS_complex",
        "dbSNP_150_id",
        "Codon_substitution"
    };
}

namespace {

using Row = std::map<std::string, std::string>;

bool has_value(const Row& row, const std::string& column) {
    auto it = row.find(column);
    return it != row.end() && !it->second.empty() && it->second != ".";
}

bool matches_alleles(const Row& row, const std::string& ref, const std::string& alt) {
    auto ref_it = row.find("Ref");
    auto alt_it = row.find("Alt");
    if (ref_it != row.end() && ref_it->second != ref) return false;
    if (alt_it != row.end() && alt_it->second != alt) return false;
    return true;
}

Row row_fields(const Row& row, const std::vector<std::string>& fields) {
    Row result;
    for (const auto& field : fields) {
        if (has_value(row, field)) {
            result["mitimpact:" + field] = row.at(field);
        }
    }

    if (has_value(row, "AA_ref") && has_value(row, "AA_position") && has_value(row, "AA_alt")) {
        std::string protein = "p." + row.at("AA_ref") + row.at("AA_position") + row.at("AA_alt");
        result["mitimpact:protein"] = protein;
        if (has_value(row, "Gene_symbol")) {
            result["mitimpact:change"] = row.at("Gene_symbol") + " " + protein;
        }
    }
    return result;
}

} // anonymous namespace

std::map<std::string, std::string> summarize_mitimpact_rows(
    const std::vector<std::map<std::string, std::string>>& rows,
    const std::string& ref,
    const std::string& alt,
    const std::vector<std::string>& fields
) {
    for (const auto& row : rows) {
        if (matches_alleles(row, ref, alt)) return row_fields(row, fields);
    }

    // No exact allele match: keep everything reported at the position
    Row merged;
    for (const auto& row : rows) {
        for (const auto& entry : row_fields(row, fields)) {
            auto it = merged.find(entry.first);
            if (it == merged.end()) {
                merged.insert(entry);
                continue;
            }
            const auto values = split_line(it->second, ',');
            if (std::find(values.begin(), values.end(), entry.second) == values.end()) {
                it->second += "," + entry.second;
            }
        }
    }
    return merged;
}

/**
 * MitImpact Annotation Source
 *
 * Rows are matched on Start/Ref/Alt, falling back to all rows at the
 * position. Besides the selected columns the source reports the protein
 * change ("p.T146A") and a gene-qualified change ("MT-ND1 p.T146A").
 */
class MitImpactSource : public VariantAnnotationSource {
public:
    MitImpactSource(const std::string& path, std::vector<std::string> fields)
        : path_(path), fields_(std::move(fields)) {
        if (fields_.empty()) fields_ = mitimpact_default_fields();
    }

    std::string name() const override { return "mitimpact"; }
    std::string type() const override { return "pathogenicity"; }
    std::string description() const override {
        return "MitImpact pathogenicity predictions for mitochondrial coding variants";
    }

    bool is_ready() const override { return reader_ != nullptr && reader_->is_valid(); }

    void initialize() override {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (reader_ || attempted_) return;
        attempted_ = true;

        log(LogLevel::INFO, "Loading MitImpact from: " + path_);

        reader_ = std::make_unique<TabixTSVReader>(path_);

        if (!reader_->is_valid()) {
            log(LogLevel::ERROR, "Failed to open MitImpact file: " + path_);
            reader_.reset();
            return;
        }

        auto columns = reader_->get_columns();
        for (const auto& field : fields_) {
            if (std::find(columns.begin(), columns.end(), field) == columns.end()) {
                log(LogLevel::WARNING, "MitImpact column not found: " + field);
            }
        }

        log(LogLevel::INFO, "MitImpact loaded with " + std::to_string(columns.size()) + " columns");
    }

    void annotate(
        const AnnotatedVariant& variant,
        std::map<std::string, std::string>& annotations
    ) override {
        const VariantCall& call = variant.call;
        auto result = query(call.chrom, call.pos, call.ref_allele, call.alt_allele);

        if (result.empty()) {
            throw EnrichmentUnavailable("no MitImpact record for " + impact_key(call));
        }

        for (auto& entry : result) {
            annotations[entry.first] = std::move(entry.second);
        }
    }

    std::map<std::string, std::string> query(
        const std::string& chrom,
        int pos,
        const std::string& ref,
        const std::string& alt
    ) override {
        ensure_initialized();

        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!reader_) {
            throw EnrichmentUnavailable("MitImpact source is unavailable (" + path_ + ")");
        }

        return summarize_mitimpact_rows(reader_->query(chrom, pos), ref, alt, fields_);
    }

    std::vector<std::string> get_fields() const override {
        std::vector<std::string> fields = {"mitimpact:protein", "mitimpact:change"};
        for (const auto& field : fields_) {
            fields.push_back("mitimpact:" + field);
        }
        return fields;
    }

    std::string get_data_path() const override { return path_; }

private:
    std::string path_;
    std::vector<std::string> fields_;
    std::unique_ptr<TabixTSVReader> reader_;
    bool attempted_ = false;
};

/**
 * Factory function to create MitImpact source
 */
std::shared_ptr<VariantAnnotationSource> create_mitimpact_source(
    const std::string& path,
    const std::vector<std::string>& fields
) {
    return std::make_shared<MitImpactSource>(path, fields);
}

} // namespace mtvep
