/**
 * Annotation Source Manager - Implementation
 */

#include "annotation_source.hpp"
#include <sstream>

namespace mtvep {

void AnnotationSourceManager::add_source(std::shared_ptr<AnnotationSource> source) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    sources_.push_back(std::move(source));
}

std::vector<std::shared_ptr<AnnotationSource>> AnnotationSourceManager::get_sources() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sources_;
}

std::shared_ptr<AnnotationSource> AnnotationSourceManager::get_source(
    const std::string& name
) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& source : sources_) {
        if (source->name() == name) {
            return source;
        }
    }
    return nullptr;
}

void AnnotationSourceManager::set_enabled(const std::string& name, bool enabled) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (enabled) {
        disabled_.erase(name);
    } else {
        disabled_.insert(name);
    }
}

bool AnnotationSourceManager::is_enabled(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return disabled_.count(name) == 0;
}

void AnnotationSourceManager::initialize_all() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (auto& source : sources_) {
        if (!source->is_ready() && disabled_.count(source->name()) == 0) {
            source->initialize();
            if (!source->is_ready()) {
                log(LogLevel::WARNING, "Annotation source '" + source->name() +
                    "' is unavailable; its fields will be left empty");
            }
        }
    }
}

int AnnotationSourceManager::annotate_all(
    const AnnotatedVariant& variant,
    std::map<std::string, std::string>& annotations
) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    int contributed = 0;

    for (auto& source : sources_) {
        if (disabled_.count(source->name()) != 0) continue;

        try {
            size_t before = annotations.size();
            source->annotate(variant, annotations);
            if (annotations.size() > before) ++contributed;
        } catch (const EnrichmentUnavailable& e) {
            log(LogLevel::DEBUG, "No " + source->name() + " data for " +
                impact_key(variant.call) + ": " + e.what());
        } catch (const std::exception& e) {
            log(LogLevel::WARNING, "Annotation source '" + source->name() +
                "' failed for " + impact_key(variant.call) + ": " + e.what());
        }
    }

    return contributed;
}

std::vector<std::string> AnnotationSourceManager::get_all_fields() const {
    std::vector<std::string> result;
    std::shared_lock<std::shared_mutex> lock(mutex_);

    for (const auto& source : sources_) {
        if (disabled_.count(source->name()) != 0) continue;
        for (const auto& field : source->get_fields()) {
            result.push_back(field);
        }
    }

    return result;
}

bool AnnotationSourceManager::empty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sources_.empty();
}

std::string AnnotationSourceManager::get_stats() const {
    std::ostringstream oss;
    std::shared_lock<std::shared_mutex> lock(mutex_);

    oss << "Annotation Sources (" << sources_.size() << "):\n";

    for (const auto& source : sources_) {
        oss << "  " << source->name() << " [" << source->type() << "]";

        if (disabled_.count(source->name())) {
            oss << " (disabled)";
        } else if (source->is_ready()) {
            oss << " (ready)";
        } else {
            oss << " (not loaded)";
        }

        if (!source->get_data_path().empty()) {
            oss << " - " << source->get_data_path();
        }

        oss << "\n";
    }

    return oss.str();
}

} // namespace mtvep
