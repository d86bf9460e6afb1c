/**
 * Output Writer - Multiple Output Format Support
 *
 * Supports TSV (default) and JSON output formats.
 */

#ifndef MTVEP_OUTPUT_WRITER_HPP
#define MTVEP_OUTPUT_WRITER_HPP

#include "mt_annotator.hpp"
#include "pipeline.hpp"
#include <string>
#include <vector>
#include <memory>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <cctype>
#include <zlib.h>

namespace mtvep {

/**
 * Output format types
 */
enum class OutputFormat {
    TSV,    // Tab-separated values (default)
    JSON    // JSON array of per-sample objects
};

/**
 * Parse output format from string
 */
inline OutputFormat parse_output_format(const std::string& format) {
    std::string lower = format;
    for (size_t i = 0; i < lower.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(lower[i])));
    }

    if (lower == "json") return OutputFormat::JSON;
    return OutputFormat::TSV;
}

/**
 * Statistics collector for annotation summary
 */
struct AnnotationStats {
    int total_sets = 0;
    int failed_sets = 0;
    int total_variants = 0;
    int coding_variants = 0;
    int skipped_records = 0;
    std::map<std::string, int> region_counts;
    std::map<std::string, int> consequence_counts;
    std::map<std::string, int> gene_counts;

    void add(const AnnotatedResult& result) {
        total_sets++;
        if (!result.completed) {
            failed_sets++;
            return;
        }

        skipped_records += static_cast<int>(result.skipped.size());
        for (const auto& variant : result.annotated_variants) {
            total_variants++;
            region_counts[variant.region ? region_to_string(*variant.region) : "intergenic"]++;
            if (variant.is_coding()) coding_variants++;
            if (variant.gene) gene_counts[*variant.gene]++;
        }
        for (const auto& csq : result.consequences) {
            consequence_counts[consequence_to_string(csq.consequence)]++;
        }
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "=== Annotation Statistics ===\n";
        oss << "Variant sets: " << total_sets << " (" << failed_sets << " failed)\n";
        oss << "Total variants: " << total_variants << "\n";
        oss << "Coding variants: " << coding_variants << "\n";
        oss << "Skipped records: " << skipped_records << "\n";
        oss << "\nRegion counts:\n";
        for (const auto& pair : region_counts) {
            oss << "  " << pair.first << ": " << pair.second << "\n";
        }
        oss << "\nConsequence counts:\n";
        for (const auto& pair : consequence_counts) {
            oss << "  " << pair.first << ": " << pair.second << "\n";
        }
        return oss.str();
    }

    std::string to_json() const {
        std::ostringstream oss;
        oss << "{\n";
        oss << "  \"total_sets\": " << total_sets << ",\n";
        oss << "  \"failed_sets\": " << failed_sets << ",\n";
        oss << "  \"total_variants\": " << total_variants << ",\n";
        oss << "  \"coding_variants\": " << coding_variants << ",\n";
        oss << "  \"skipped_records\": " << skipped_records << ",\n";
        oss << "  \"region_counts\": {";
        bool first = true;
        for (const auto& pair : region_counts) {
            if (!first) oss << ",";
            oss << "\n    \"" << pair.first << "\": " << pair.second;
            first = false;
        }
        oss << "\n  },\n";
        oss << "  \"consequence_counts\": {";
        first = true;
        for (const auto& pair : consequence_counts) {
            if (!first) oss << ",";
            oss << "\n    \"" << pair.first << "\": " << pair.second;
            first = false;
        }
        oss << "\n  }\n";
        oss << "}";
        return oss.str();
    }
};

// Helper to check if path ends with .gz
inline bool ends_with_gz(const std::string& path) {
    return path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

inline std::string escape_json(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:   result += c; break;
        }
    }
    return result;
}

inline std::string format_optional(const std::optional<int>& value, const std::string& empty_val = "-") {
    return value ? std::to_string(*value) : empty_val;
}

// Impact values as key=value pairs separated by semicolons
inline std::string format_impact(const std::map<std::string, std::string>& impact) {
    std::string result;
    for (const auto& pair : impact) {
        if (!result.empty()) result += ";";
        result += pair.first + "=" + pair.second;
    }
    return result.empty() ? "-" : result;
}

/**
 * Sink for plain, gzip-compressed or stdout output
 */
class OutputSink {
public:
    explicit OutputSink(const std::string& output_path, bool compress = false)
        : output_path_(output_path), compress_(compress), gz_file_(nullptr),
          use_stdout_(output_path.empty() || output_path == "-" || output_path == "STDOUT") {

        if (use_stdout_) {
            compress_ = false;  // Cannot compress stdout
        } else if (compress_ || ends_with_gz(output_path_)) {
            compress_ = true;
            gz_file_ = gzopen(output_path_.c_str(), "wb");
            if (!gz_file_) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        } else {
            output_.open(output_path_);
            if (!output_.is_open()) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        }
    }

    ~OutputSink() { close(); }

    OutputSink(const OutputSink&) = delete;
    OutputSink& operator=(const OutputSink&) = delete;

    void write(const std::string& s) {
        if (use_stdout_) {
            std::cout << s;
        } else if (compress_ && gz_file_) {
            gzwrite(gz_file_, s.c_str(), static_cast<unsigned int>(s.size()));
        } else {
            output_ << s;
        }
    }

    void close() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (output_.is_open()) {
            output_.close();
        }
        if (use_stdout_) {
            std::cout.flush();
        }
    }

private:
    std::string output_path_;
    bool compress_;
    std::ofstream output_;
    gzFile gz_file_;
    bool use_stdout_;
};

/**
 * Abstract base class for output writers
 */
class OutputWriter {
public:
    virtual ~OutputWriter() = default;

    /**
     * @param impact_fields "source:field" columns to report
     */
    virtual void write_header(const std::vector<std::string>& impact_fields) = 0;
    virtual void write_result(const AnnotatedResult& result) = 0;
    virtual void write_footer() = 0;
    virtual void close() = 0;

    void write_header() { write_header(std::vector<std::string>()); }

    void write_results(const std::vector<AnnotatedResult>& results) {
        for (const auto& result : results) {
            write_result(result);
        }
    }

    const AnnotationStats& get_stats() const { return stats_; }

    void set_skip_header(bool v) { skip_header_ = v; }

protected:
    AnnotationStats stats_;
    bool skip_header_ = false;
};

/**
 * TSV output writer (default format)
 *
 * One row per consequence for coding variants with predictions, otherwise
 * one row per variant. Failed sets are not written.
 */
class TSVWriter : public OutputWriter {
public:
    explicit TSVWriter(const std::string& output_path, bool compress = false)
        : sink_(output_path, compress) {}

    ~TSVWriter() override {
        close();
    }

    using OutputWriter::write_header;
    void write_header(const std::vector<std::string>& impact_fields) override {
        impact_fields_ = impact_fields;
        if (skip_header_) return;

        std::ostringstream header;
        header << "#Sample\tChrom\tPosition\tRef\tAlt\tType\tDepth\tAlt_depth\tPass\t"
               << "Gene\tOverlap_genes\tRegion\tLocal_start\tLocal_end\t"
               << "Start_codon\tEnd_codon\tProtein_position\tCodons\tAmino_acids\t"
               << "Consequence\tProtein_change";
        if (impact_fields_.empty()) {
            header << "\tImpact";
        } else {
            for (const auto& field : impact_fields_) {
                header << "\t" << field;
            }
        }
        header << "\n";

        sink_.write(header.str());
    }

    void write_result(const AnnotatedResult& result) override {
        stats_.add(result);
        if (!result.completed) return;

        // Consequences grouped by owning variant
        std::vector<std::vector<size_t>> by_variant(result.annotated_variants.size());
        for (size_t i = 0; i < result.consequence_owner.size() && i < result.consequences.size(); ++i) {
            size_t owner = result.consequence_owner[i];
            if (owner < by_variant.size()) by_variant[owner].push_back(i);
        }

        for (size_t v = 0; v < result.annotated_variants.size(); ++v) {
            const auto& variant = result.annotated_variants[v];
            if (by_variant[v].empty()) {
                write_row(result.sample, variant, nullptr);
            } else {
                for (size_t c : by_variant[v]) {
                    write_row(result.sample, variant, &result.consequences[c]);
                }
            }
        }
    }

    void write_footer() override {
        // TSV has no footer
    }

    void close() override {
        sink_.close();
    }

private:
    OutputSink sink_;
    std::vector<std::string> impact_fields_;

    void write_row(const std::string& sample, const AnnotatedVariant& variant,
                   const ConsequenceAnnotation* csq) {
        const VariantCall& call = variant.call;
        std::ostringstream line;

        line << sample << "\t"
             << call.chrom << "\t"
             << position_string(call) << "\t"
             << call.ref_allele << "\t"
             << call.alt_allele << "\t"
             << variant_type(call) << "\t"
             << call.depth << "\t"
             << call.alt_depth << "\t"
             << (call.pass_filter ? "PASS" : "FAIL") << "\t";

        line << variant.gene.value_or("-") << "\t"
             << (variant.overlap_genes.empty() ? "-" : variant.overlap_genes_string()) << "\t"
             << (variant.region ? region_to_string(*variant.region) : "intergenic") << "\t"
             << format_optional(variant.local_start) << "\t"
             << format_optional(variant.local_end) << "\t"
             << format_optional(variant.start_codon) << "\t"
             << format_optional(variant.end_codon) << "\t";

        if (csq) {
            line << csq->protein_position() << "\t"
                 << (csq->ref_codon.empty() ? "-" : csq->ref_codon) << "/"
                 << (csq->alt_codon.empty() ? "-" : csq->alt_codon) << "\t"
                 << csq->ref_aa << "/" << csq->alt_aa << "\t"
                 << consequence_to_string(csq->consequence) << "\t"
                 << csq->protein_change();
        } else {
            line << "-\t-\t-\t-\t-";
        }

        if (impact_fields_.empty()) {
            line << "\t" << format_impact(variant.impact);
        } else {
            for (const auto& field : impact_fields_) {
                auto it = variant.impact.find(field);
                line << "\t" << (it != variant.impact.end() ? it->second : "-");
            }
        }
        line << "\n";

        sink_.write(line.str());
    }
};

/**
 * JSON output writer
 *
 * One object per variant set with its variants, consequences and skipped
 * records. Skipped input lines carry "line" instead of "record"; failed
 * sets carry the failure reason.
 */
class JSONWriter : public OutputWriter {
public:
    explicit JSONWriter(const std::string& output_path, bool compress = false)
        : sink_(output_path, compress) {}

    ~JSONWriter() override {
        close();
    }

    using OutputWriter::write_header;
    void write_header(const std::vector<std::string>& /*impact_fields*/) override {
        if (!skip_header_) sink_.write("[\n");
    }

    void write_result(const AnnotatedResult& result) override {
        stats_.add(result);

        std::ostringstream json;
        if (!first_result_) json << ",\n";
        first_result_ = false;

        json << "  {\n";
        json << "    \"sample\": \"" << escape_json(result.sample) << "\",\n";
        json << "    \"completed\": " << (result.completed ? "true" : "false") << ",\n";
        if (!result.completed) {
            json << "    \"failure\": \"" << escape_json(result.failure) << "\",\n";
        }

        json << "    \"variants\": [";
        for (size_t i = 0; i < result.annotated_variants.size(); ++i) {
            const auto& variant = result.annotated_variants[i];
            json << (i == 0 ? "\n" : ",\n");
            json << "      {\"chrom\": \"" << escape_json(variant.call.chrom) << "\""
                 << ", \"pos\": " << variant.call.pos
                 << ", \"ref\": \"" << escape_json(variant.call.ref_allele) << "\""
                 << ", \"alt\": \"" << escape_json(variant.call.alt_allele) << "\""
                 << ", \"pass\": " << (variant.call.pass_filter ? "true" : "false");
            if (variant.gene) json << ", \"gene\": \"" << escape_json(*variant.gene) << "\"";
            if (variant.region) json << ", \"region\": \"" << region_to_string(*variant.region) << "\"";
            if (!variant.overlap_genes.empty()) {
                json << ", \"overlap_genes\": \"" << escape_json(variant.overlap_genes_string()) << "\"";
            }
            if (variant.local_start) json << ", \"local_start\": " << *variant.local_start;
            if (variant.local_end) json << ", \"local_end\": " << *variant.local_end;
            if (variant.start_codon) json << ", \"start_codon\": " << *variant.start_codon;
            if (variant.end_codon) json << ", \"end_codon\": " << *variant.end_codon;
            if (!variant.impact.empty()) {
                json << ", \"impact\": {";
                bool first = true;
                for (const auto& pair : variant.impact) {
                    if (!first) json << ", ";
                    json << "\"" << escape_json(pair.first) << "\": \"" << escape_json(pair.second) << "\"";
                    first = false;
                }
                json << "}";
            }
            json << "}";
        }
        json << (result.annotated_variants.empty() ? "],\n" : "\n    ],\n");

        json << "    \"consequences\": [";
        for (size_t i = 0; i < result.consequences.size(); ++i) {
            const auto& csq = result.consequences[i];
            json << (i == 0 ? "\n" : ",\n");
            json << "      {\"gene\": \"" << escape_json(csq.gene) << "\""
                 << ", \"codon_index\": " << csq.codon_index
                 << ", \"ref_codon\": \"" << csq.ref_codon << "\""
                 << ", \"alt_codon\": \"" << csq.alt_codon << "\""
                 << ", \"ref_aa\": \"" << csq.ref_aa << "\""
                 << ", \"alt_aa\": \"" << csq.alt_aa << "\""
                 << ", \"consequence\": \"" << consequence_to_string(csq.consequence) << "\""
                 << ", \"protein_change\": \"" << escape_json(csq.protein_change()) << "\"}";
        }
        json << (result.consequences.empty() ? "],\n" : "\n    ],\n");

        json << "    \"skipped\": [";
        for (size_t i = 0; i < result.skipped.size(); ++i) {
            const auto& skip = result.skipped[i];
            json << (i == 0 ? "\n" : ",\n");
            if (skip.from_input()) {
                json << "      {\"line\": " << skip.line_number;
            } else {
                json << "      {\"record\": " << skip.record_index;
            }
            json << ", \"reason\": \"" << escape_json(skip.reason) << "\"}";
        }
        json << (result.skipped.empty() ? "]\n" : "\n    ]\n");
        json << "  }";

        sink_.write(json.str());
    }

    void write_footer() override {
        if (!skip_header_) sink_.write("\n]\n");
    }

    void close() override {
        sink_.close();
    }

private:
    OutputSink sink_;
    bool first_result_ = true;
};

/**
 * Create an output writer for the given format
 */
inline std::unique_ptr<OutputWriter> create_output_writer(
    OutputFormat format,
    const std::string& output_path,
    bool compress = false
) {
    switch (format) {
        case OutputFormat::JSON:
            return std::make_unique<JSONWriter>(output_path, compress);
        case OutputFormat::TSV:
        default:
            return std::make_unique<TSVWriter>(output_path, compress);
    }
}

} // namespace mtvep

#endif // MTVEP_OUTPUT_WRITER_HPP
