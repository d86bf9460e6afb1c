/**
 * File Format Parsers
 *
 * Readers for the inputs of a mitochondrial annotation run:
 * - Annotation table (TSV, optionally gzipped)
 * - Variant calls (VCF, optionally gzipped)
 * - Tabix-indexed TSV (MitImpact-style impact tables)
 */

#ifndef MTVEP_FILE_PARSERS_HPP
#define MTVEP_FILE_PARSERS_HPP

#include "mt_annotator.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>

namespace mtvep {

// ============================================================================
// Line Reader
// ============================================================================

/**
 * Line-oriented reader over plain or gzip-compressed text files.
 * zlib reads uncompressed input transparently.
 */
class GzLineReader {
public:
    /**
     * @throws ConfigurationError if the file cannot be opened
     */
    explicit GzLineReader(const std::string& path);

    ~GzLineReader();

    // Prevent copying
    GzLineReader(const GzLineReader&) = delete;
    GzLineReader& operator=(const GzLineReader&) = delete;

    /**
     * Read next line without the trailing newline / carriage return
     * @return false at end of file
     */
    bool next(std::string& line);

    /**
     * 1-based number of the line last returned
     */
    int line_number() const { return line_number_; }

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
    int line_number_ = 0;
};

// ============================================================================
// Tabix TSV Reader
// ============================================================================

/**
 * Reader for tabix-indexed TSV files
 * Requires htslib for actual functionality
 */
class TabixTSVReader {
public:
    /**
     * Open a tabix-indexed TSV file
     * @param path Path to .tsv.gz file (must have .tbi index)
     * @param columns Column names, read from the '#' header line if empty
     */
    explicit TabixTSVReader(
        const std::string& path,
        const std::vector<std::string>& columns = {}
    );

    ~TabixTSVReader();

    // Prevent copying
    TabixTSVReader(const TabixTSVReader&) = delete;
    TabixTSVReader& operator=(const TabixTSVReader&) = delete;

    /**
     * Query rows at a single position
     */
    std::vector<std::map<std::string, std::string>> query(
        const std::string& chrom,
        int pos
    );

    std::vector<std::map<std::string, std::string>> query_range(
        const std::string& chrom,
        int start,
        int end
    );

    /**
     * Column names from the header line
     */
    std::vector<std::string> get_columns() const;

    bool is_valid() const;

    std::string get_path() const { return path_; }

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
    std::string path_;
};

// ============================================================================
// Interval Tree
// ============================================================================

/**
 * Centered interval tree for overlap queries.
 * Build once after all insertions; results are unordered.
 */
template<typename T>
class IntervalTree {
public:
    IntervalTree() = default;

    /**
     * Add an interval
     * @param start Start position (inclusive)
     * @param end End position (inclusive)
     * @param data Payload returned by queries
     */
    void insert(int start, int end, T data);

    /**
     * Build tree structure (call after all insertions)
     */
    void build();

    /**
     * Payloads of intervals containing point
     */
    std::vector<T> query(int point) const;

    /**
     * Payloads of intervals overlapping [start, end]
     */
    std::vector<T> query(int start, int end) const;

    bool is_built() const { return built_; }

    size_t size() const { return intervals_.size(); }

    void clear();

private:
    struct Interval {
        int start;
        int end;
        T data;
    };

    std::vector<Interval> intervals_;
    bool built_ = false;

    struct Node {
        int center;
        std::vector<size_t> overlapping;  // Indices sorted by start
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;
    };

    std::unique_ptr<Node> root_;

    std::unique_ptr<Node> build_tree(std::vector<size_t>& indices, int depth = 0);
    void query_node(const Node* node, int start, int end, std::vector<T>& results) const;
};

// ============================================================================
// Annotation table
// ============================================================================

/**
 * Parse one annotation table row: chrom, start, end, strand, gene, region
 * @throws ConfigurationError for malformed rows
 */
GenomicInterval parse_annotation_line(const std::string& line);

/**
 * Load an annotation table. Blank lines and '#' comments are skipped.
 * @throws ConfigurationError if the file is missing or a row is malformed
 */
std::vector<GenomicInterval> load_annotation_table(const std::string& path);

// ============================================================================
// VCF
// ============================================================================

/**
 * Parse a VCF data line into one call per ALT allele.
 * DP and AD are taken from the first sample's FORMAT column, falling back
 * to INFO/DP.
 * @throws MalformedVariantError for lines that cannot be parsed
 */
std::vector<VariantCall> parse_vcf_line(const std::string& line);

/**
 * Load a single-sample VCF into a variant set. The sample name is taken from
 * the #CHROM header, falling back to the file stem. Unparseable lines are
 * skipped and listed in the set's parse_issues.
 * @throws ConfigurationError if the file cannot be opened
 */
VariantSet load_vcf(const std::string& path);

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * Parse a line into fields by delimiter
 */
std::vector<std::string> split_line(const std::string& line, char delim = '\t');

/**
 * Check if a file exists
 */
bool file_exists(const std::string& path);

/**
 * Get file extension (handles .gz)
 */
std::string get_extension(const std::string& path);

} // namespace mtvep

#endif // MTVEP_FILE_PARSERS_HPP
