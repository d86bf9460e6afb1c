/**
 * Annotation Source Factory Functions
 *
 * Provides factory functions to create impact annotation sources.
 */

#ifndef MTVEP_ANNOTATION_SOURCES_HPP
#define MTVEP_ANNOTATION_SOURCES_HPP

#include "annotation_source.hpp"
#include <string>
#include <map>
#include <memory>
#include <vector>

namespace mtvep {

// ============================================================================
// Pathogenicity Sources
// ============================================================================

/**
 * MitImpact columns reported when no field list is given
 */
std::vector<std::string> mitimpact_default_fields();

/**
 * Reduce MitImpact rows at one position to "mitimpact:*" fields.
 * A row matching ref/alt wins; otherwise every row at the position is kept
 * and differing values are joined with ','.
 */
std::map<std::string, std::string> summarize_mitimpact_rows(
    const std::vector<std::map<std::string, std::string>>& rows,
    const std::string& ref,
    const std::string& alt,
    const std::vector<std::string>& fields
);

/**
 * Create MitImpact annotation source
 * @param path Path to tabix-indexed MitImpact export (.txt.gz + .tbi)
 * @param fields MitImpact columns to report (default: mitimpact_default_fields())
 */
std::shared_ptr<VariantAnnotationSource> create_mitimpact_source(
    const std::string& path,
    const std::vector<std::string>& fields = {}
);

} // namespace mtvep

#endif // MTVEP_ANNOTATION_SOURCES_HPP
