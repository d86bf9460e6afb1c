/**
 * File Format Parsers - Implementation
 */

#include "file_parsers.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <sys/stat.h>

#ifdef HAVE_HTSLIB
#include <htslib/tbx.h>
#include <htslib/hts.h>
#include <htslib/kstring.h>
#endif

#include <zlib.h>

namespace mtvep {

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<std::string> split_line(const std::string& line, char delim) {
    std::vector<std::string> result;
    size_t start = 0;
    size_t pos = line.find(delim);
    while (pos != std::string::npos) {
        result.emplace_back(line, start, pos - start);
        start = pos + 1;
        pos = line.find(delim, start);
    }
    result.emplace_back(line, start);
    return result;
}

bool file_exists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0);
}

std::string get_extension(const std::string& path) {
    std::string ext;
    size_t dot = path.rfind('.');
    size_t slash = path.rfind('/');

    if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
        ext = path.substr(dot);

        // Handle .gz compression
        if (ext == ".gz" && dot > 0) {
            size_t dot2 = path.rfind('.', dot - 1);
            if (dot2 != std::string::npos && (slash == std::string::npos || dot2 > slash)) {
                ext = path.substr(dot2);
            }
        }
    }

    return ext;
}

namespace {

// Strict integer parse: the whole field must be a number
bool parse_int(const std::string& field, int& value) {
    if (field.empty()) return false;
    char* end = nullptr;
    long parsed = std::strtol(field.c_str(), &end, 10);
    if (end != field.c_str() + field.size()) return false;
    if (parsed < INT_MIN || parsed > INT_MAX) return false;
    value = static_cast<int>(parsed);
    return true;
}

// '.' and empty FORMAT/INFO values count as missing
int parse_count(const std::string& field) {
    int value = 0;
    if (field == "." || !parse_int(field, value)) return 0;
    return value;
}

std::string file_stem(const std::string& path) {
    size_t slash = path.rfind('/');
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    std::string ext = get_extension(name);
    return name.substr(0, name.size() - ext.size());
}

} // anonymous namespace

// ============================================================================
// GzLineReader Implementation
// ============================================================================

struct GzLineReader::Impl {
    gzFile gz = nullptr;
    char buffer[8192];

    ~Impl() {
        if (gz) gzclose(gz);
    }
};

GzLineReader::GzLineReader(const std::string& path)
    : pimpl_(std::make_unique<Impl>()) {
    pimpl_->gz = gzopen(path.c_str(), "rb");
    if (!pimpl_->gz) {
        throw ConfigurationError("Cannot open file: " + path);
    }
}

GzLineReader::~GzLineReader() = default;

bool GzLineReader::next(std::string& line) {
    line.clear();
    bool got_data = false;

    // Lines longer than the buffer arrive in several chunks
    while (gzgets(pimpl_->gz, pimpl_->buffer, sizeof(pimpl_->buffer)) != nullptr) {
        got_data = true;
        line += pimpl_->buffer;
        if (!line.empty() && line.back() == '\n') break;
    }

    if (!got_data) return false;

    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    ++line_number_;
    return true;
}

// ============================================================================
// TabixTSVReader Implementation
// ============================================================================

#ifdef HAVE_HTSLIB

struct TabixTSVReader::Impl {
    htsFile* fp = nullptr;
    tbx_t* tbx = nullptr;
    std::vector<std::string> columns;
    bool valid = false;

    ~Impl() {
        if (tbx) tbx_destroy(tbx);
        if (fp) hts_close(fp);
    }
};

TabixTSVReader::TabixTSVReader(
    const std::string& path,
    const std::vector<std::string>& columns
) : pimpl_(std::make_unique<Impl>()), path_(path) {

    pimpl_->fp = hts_open(path.c_str(), "r");
    if (!pimpl_->fp) {
        log(LogLevel::ERROR, "Cannot open TSV file: " + path);
        return;
    }

    pimpl_->tbx = tbx_index_load(path.c_str());
    if (!pimpl_->tbx) {
        log(LogLevel::ERROR, "Cannot load tabix index for: " + path);
        return;
    }

    // Read header to get column names
    kstring_t str = {0, 0, nullptr};
    while (hts_getline(pimpl_->fp, KS_SEP_LINE, &str) >= 0) {
        if (str.l == 0) continue;
        if (str.s[0] == '#') {
            std::string header(str.s, str.l);
            header = header.substr(1);
            pimpl_->columns = split_line(header, '\t');
        } else {
            break;  // End of header
        }
    }
    free(str.s);

    if (!columns.empty()) {
        pimpl_->columns = columns;
    }

    pimpl_->valid = true;
    log(LogLevel::INFO, "Opened tabix TSV: " + path + " (" +
        std::to_string(pimpl_->columns.size()) + " columns)");
}

TabixTSVReader::~TabixTSVReader() = default;

std::vector<std::map<std::string, std::string>> TabixTSVReader::query(
    const std::string& chrom,
    int pos
) {
    return query_range(chrom, pos, pos);
}

std::vector<std::map<std::string, std::string>> TabixTSVReader::query_range(
    const std::string& chrom,
    int start,
    int end
) {
    std::vector<std::map<std::string, std::string>> results;

    if (!pimpl_->valid) return results;

    // Impact tables name the mitochondrial contig differently across releases
    std::vector<std::string> chrom_variants = {chrom};
    for (const char* alias : {"chrM", "MT", "M", "chrMT"}) {
        if (chrom != alias) chrom_variants.emplace_back(alias);
    }

    for (const auto& try_chrom : chrom_variants) {
        std::string region = try_chrom + ":" + std::to_string(start) + "-" + std::to_string(end);

        hts_itr_t* itr = tbx_itr_querys(pimpl_->tbx, region.c_str());
        if (!itr) continue;

        kstring_t str = {0, 0, nullptr};

        while (tbx_itr_next(pimpl_->fp, pimpl_->tbx, itr, &str) >= 0) {
            auto fields = split_line(std::string(str.s, str.l), '\t');

            std::map<std::string, std::string> row;
            for (size_t i = 0; i < fields.size() && i < pimpl_->columns.size(); ++i) {
                row[pimpl_->columns[i]] = fields[i];
            }

            results.push_back(std::move(row));
        }

        free(str.s);
        tbx_itr_destroy(itr);

        if (!results.empty()) break;
    }

    return results;
}

std::vector<std::string> TabixTSVReader::get_columns() const {
    return pimpl_->columns;
}

bool TabixTSVReader::is_valid() const {
    return pimpl_->valid;
}

#else  // No HTSLIB

struct TabixTSVReader::Impl {
    bool valid = false;
};

TabixTSVReader::TabixTSVReader(
    const std::string& path,
    const std::vector<std::string>&
) : pimpl_(std::make_unique<Impl>()), path_(path) {
    log(LogLevel::WARNING, "TabixTSVReader requires htslib. Build with -DHAVE_HTSLIB");
}

TabixTSVReader::~TabixTSVReader() = default;

std::vector<std::map<std::string, std::string>> TabixTSVReader::query(
    const std::string&, int) {
    return {};
}

std::vector<std::map<std::string, std::string>> TabixTSVReader::query_range(
    const std::string&, int, int) {
    return {};
}

std::vector<std::string> TabixTSVReader::get_columns() const {
    return {};
}

bool TabixTSVReader::is_valid() const {
    return false;
}

#endif  // HAVE_HTSLIB

// ============================================================================
// IntervalTree Implementation
// ============================================================================

template<typename T>
void IntervalTree<T>::insert(int start, int end, T data) {
    intervals_.push_back({start, end, std::move(data)});
    built_ = false;
}

template<typename T>
void IntervalTree<T>::build() {
    root_.reset();
    if (intervals_.empty()) {
        built_ = true;
        return;
    }

    std::vector<size_t> indices(intervals_.size());
    for (size_t i = 0; i < indices.size(); ++i) {
        indices[i] = i;
    }

    root_ = build_tree(indices);
    built_ = true;
}

template<typename T>
std::unique_ptr<typename IntervalTree<T>::Node> IntervalTree<T>::build_tree(
    std::vector<size_t>& indices,
    int depth
) {
    if (indices.empty()) return nullptr;

    // Find center point
    int min_start = INT_MAX, max_end = INT_MIN;
    for (size_t idx : indices) {
        min_start = std::min(min_start, intervals_[idx].start);
        max_end = std::max(max_end, intervals_[idx].end);
    }
    int center = min_start + (max_end - min_start) / 2;

    auto node = std::make_unique<Node>();
    node->center = center;

    std::vector<size_t> left_indices, right_indices;

    for (size_t idx : indices) {
        const auto& interval = intervals_[idx];

        if (interval.end < center) {
            left_indices.push_back(idx);
        } else if (interval.start > center) {
            right_indices.push_back(idx);
        } else {
            node->overlapping.push_back(idx);
        }
    }

    std::sort(node->overlapping.begin(), node->overlapping.end(),
              [this](size_t a, size_t b) {
                  return intervals_[a].start < intervals_[b].start;
              });

    if (depth < 20) {  // Prevent deep recursion
        node->left = build_tree(left_indices, depth + 1);
        node->right = build_tree(right_indices, depth + 1);
    } else {
        // Flatten remaining intervals into current node
        for (size_t idx : left_indices) node->overlapping.push_back(idx);
        for (size_t idx : right_indices) node->overlapping.push_back(idx);
    }

    return node;
}

template<typename T>
std::vector<T> IntervalTree<T>::query(int point) const {
    return query(point, point);
}

template<typename T>
std::vector<T> IntervalTree<T>::query(int start, int end) const {
    std::vector<T> results;

    if (!built_ || !root_) return results;

    query_node(root_.get(), start, end, results);
    return results;
}

template<typename T>
void IntervalTree<T>::query_node(
    const Node* node,
    int start,
    int end,
    std::vector<T>& results
) const {
    if (!node) return;

    for (size_t idx : node->overlapping) {
        const auto& interval = intervals_[idx];
        if (interval.start <= end && interval.end >= start) {
            results.push_back(interval.data);
        }
    }

    if (start < node->center && node->left) {
        query_node(node->left.get(), start, end, results);
    }
    if (end > node->center && node->right) {
        query_node(node->right.get(), start, end, results);
    }
}

template<typename T>
void IntervalTree<T>::clear() {
    intervals_.clear();
    root_.reset();
    built_ = false;
}

// Explicit template instantiations
template class IntervalTree<size_t>;

// ============================================================================
// Annotation table
// ============================================================================

GenomicInterval parse_annotation_line(const std::string& line) {
    auto fields = split_line(line, '\t');
    if (fields.size() < 6) {
        throw ConfigurationError("Annotation row needs 6 columns, got " +
                                 std::to_string(fields.size()) + ": " + line);
    }

    GenomicInterval interval;
    interval.chrom = fields[0];

    if (!parse_int(fields[1], interval.start) || !parse_int(fields[2], interval.end)) {
        throw ConfigurationError("Non-numeric coordinates in annotation row: " + line);
    }
    if (interval.start < 1 || interval.end < interval.start) {
        throw ConfigurationError("Invalid interval " + fields[1] + "-" + fields[2] +
                                 " in annotation row: " + line);
    }

    const std::string& strand = fields[3];
    if (strand != "+" && strand != "-" && strand != "." && strand != "*") {
        throw ConfigurationError("Invalid strand '" + strand + "' in annotation row: " + line);
    }
    interval.strand = strand == "*" ? '.' : strand[0];

    interval.gene = fields[4];
    if (interval.gene.empty()) {
        throw ConfigurationError("Missing gene name in annotation row: " + line);
    }

    auto region = parse_region(fields[5]);
    if (!region) {
        throw ConfigurationError("Unknown region class '" + fields[5] + "' in annotation row: " + line);
    }
    interval.region = *region;

    return interval;
}

std::vector<GenomicInterval> load_annotation_table(const std::string& path) {
    log(LogLevel::INFO, "Loading annotation table from: " + path);

    GzLineReader reader(path);
    std::vector<GenomicInterval> intervals;
    std::string line;

    while (reader.next(line)) {
        if (line.empty() || line[0] == '#') continue;

        // Optional column header
        if (intervals.empty() && (line.rfind("chrom\t", 0) == 0 || line.rfind("seqnames\t", 0) == 0)) {
            continue;
        }

        try {
            intervals.push_back(parse_annotation_line(line));
        } catch (const ConfigurationError& e) {
            throw ConfigurationError(path + ":" + std::to_string(reader.line_number()) + ": " + e.what());
        }
    }

    log(LogLevel::INFO, "Loaded " + std::to_string(intervals.size()) + " annotated intervals");
    return intervals;
}

// ============================================================================
// VCF
// ============================================================================

std::vector<VariantCall> parse_vcf_line(const std::string& line) {
    auto fields = split_line(line, '\t');
    if (fields.size() < 8) {
        throw MalformedVariantError("VCF line has " + std::to_string(fields.size()) +
                                    " columns, expected at least 8");
    }

    VariantCall base;
    base.chrom = fields[0];
    if (!parse_int(fields[1], base.pos)) {
        throw MalformedVariantError("Invalid POS '" + fields[1] + "'");
    }
    base.id = fields[2] == "." ? "" : fields[2];
    base.ref_allele = fields[3];
    std::transform(base.ref_allele.begin(), base.ref_allele.end(), base.ref_allele.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    const std::string& filter = fields[6];
    base.pass_filter = (filter == "PASS" || filter == ".");

    // INFO/DP as fallback depth
    for (const auto& entry : split_line(fields[7], ';')) {
        if (entry.rfind("DP=", 0) == 0) {
            base.depth = parse_count(entry.substr(3));
        }
    }

    std::vector<std::string> allele_depths;
    if (fields.size() >= 10) {
        auto keys = split_line(fields[8], ':');
        auto values = split_line(fields[9], ':');
        for (size_t i = 0; i < keys.size() && i < values.size(); ++i) {
            if (keys[i] == "DP") {
                base.depth = parse_count(values[i]);
            } else if (keys[i] == "AD") {
                allele_depths = split_line(values[i], ',');
            }
        }
    }

    std::vector<VariantCall> calls;
    if (fields[4] == ".") return calls;  // Reference-only site

    auto alts = split_line(fields[4], ',');
    for (size_t i = 0; i < alts.size(); ++i) {
        VariantCall call = base;
        call.alt_allele = alts[i];
        std::transform(call.alt_allele.begin(), call.alt_allele.end(), call.alt_allele.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (i + 1 < allele_depths.size()) {
            call.alt_depth = parse_count(allele_depths[i + 1]);
        }
        calls.push_back(std::move(call));
    }

    return calls;
}

VariantSet load_vcf(const std::string& path) {
    log(LogLevel::INFO, "Loading variant calls from: " + path);

    GzLineReader reader(path);
    VariantSet set;
    set.sample = file_stem(path);
    std::string line;

    while (reader.next(line)) {
        if (line.empty()) continue;

        if (line[0] == '#') {
            if (line.rfind("#CHROM", 0) == 0) {
                auto header = split_line(line, '\t');
                if (header.size() >= 10) {
                    set.sample = header[9];
                }
            }
            continue;
        }

        try {
            for (auto& call : parse_vcf_line(line)) {
                set.calls.push_back(std::move(call));
            }
        } catch (const MalformedVariantError& e) {
            set.parse_issues.push_back({reader.line_number(), e.what()});
            log(LogLevel::WARNING, path + ":" + std::to_string(reader.line_number()) +
                ": skipping record: " + e.what());
        }
    }

    log(LogLevel::INFO, "Loaded " + std::to_string(set.calls.size()) + " calls for sample " + set.sample);
    return set;
}

} // namespace mtvep
