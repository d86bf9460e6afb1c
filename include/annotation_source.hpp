/**
 * Annotation Source Interface
 *
 * Base classes for impact annotation sources (pathogenicity predictions,
 * clinical reports). Provides a unified interface for enriching coding
 * variants with "source:field" values.
 */

#ifndef MTVEP_ANNOTATION_SOURCE_HPP
#define MTVEP_ANNOTATION_SOURCE_HPP

#include "mt_annotator.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace mtvep {

/**
 * Abstract base class for all annotation sources
 */
class AnnotationSource {
public:
    virtual ~AnnotationSource() = default;

    /**
     * Get the source name (e.g., "mitimpact")
     */
    virtual std::string name() const = 0;

    /**
     * Get the type of source for CLI help (e.g., "pathogenicity")
     */
    virtual std::string type() const = 0;

    virtual std::string description() const = 0;

    /**
     * Check if the source is initialized and ready
     */
    virtual bool is_ready() const = 0;

    /**
     * Initialize the source (lazy loading)
     * Called automatically on first use if not manually initialized
     */
    virtual void initialize() = 0;

    /**
     * Annotate a located variant, adding results to the annotations map
     * @param variant Variant with gene/region context
     * @param annotations Output map to populate with "source:field" -> "value" pairs
     * @throws EnrichmentUnavailable if the source has no data for the variant
     */
    virtual void annotate(
        const AnnotatedVariant& variant,
        std::map<std::string, std::string>& annotations
    ) = 0;

    /**
     * Get list of fields this source provides
     */
    virtual std::vector<std::string> get_fields() const = 0;

    /**
     * Get the data file path (for debugging/info)
     */
    virtual std::string get_data_path() const { return ""; }

protected:
    mutable std::recursive_mutex mutex_;  // Serializes lookups of sources that are not thread-safe

    /**
     * Ensure the source is initialized
     */
    void ensure_initialized() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!is_ready()) {
            initialize();
        }
    }
};

/**
 * Variant-based annotation source
 * Matches by position and allele
 */
class VariantAnnotationSource : public AnnotationSource {
public:
    /**
     * Query annotations for a specific variant, empty if no record matches
     */
    virtual std::map<std::string, std::string> query(
        const std::string& chrom,
        int pos,
        const std::string& ref,
        const std::string& alt
    ) = 0;
};

/**
 * Annotation source manager - handles multiple sources
 */
class AnnotationSourceManager {
public:
    /**
     * Register an annotation source
     */
    void add_source(std::shared_ptr<AnnotationSource> source);

    std::vector<std::shared_ptr<AnnotationSource>> get_sources() const;

    /**
     * Get source by name, nullptr if not registered
     */
    std::shared_ptr<AnnotationSource> get_source(const std::string& name) const;

    /**
     * Enable/disable a source by name
     */
    void set_enabled(const std::string& name, bool enabled);

    bool is_enabled(const std::string& name) const;

    /**
     * Initialize all enabled sources
     */
    void initialize_all();

    /**
     * Annotate a variant with all enabled sources.
     * Source failures are logged and leave the variant without that
     * source's fields.
     * @return Number of sources that contributed values
     */
    int annotate_all(
        const AnnotatedVariant& variant,
        std::map<std::string, std::string>& annotations
    );

    /**
     * Get all field names from all sources
     */
    std::vector<std::string> get_all_fields() const;

    bool empty() const;

    /**
     * Get source statistics
     */
    std::string get_stats() const;

private:
    std::vector<std::shared_ptr<AnnotationSource>> sources_;
    std::set<std::string> disabled_;
    mutable std::shared_mutex mutex_;
};

} // namespace mtvep

#endif // MTVEP_ANNOTATION_SOURCE_HPP
