/// @file validator.cpp
/// @brief Dependency validator implementation

#include <stratum/layering/validator.hpp>
#include <stratum/core/log.hpp>

#include <algorithm>
#include <sstream>

namespace stratum_layering {

// =============================================================================
// LayerViolation
// =============================================================================

std::string LayerViolation::format() const {
    std::ostringstream oss;
    oss << "Layer violation: '" << from_type << "' (layer " << from_layer
        << ") eagerly references '" << to_type << "' (layer " << to_layer << ")";
    if (is_same_layer()) {
        oss << " [same layer]";
    }
    return oss.str();
}

// =============================================================================
// ValidationReport
// =============================================================================

ValidationReport::ValidationReport(std::vector<LayerViolation> violations)
    : m_violations(std::move(violations)) {

    std::sort(m_violations.begin(), m_violations.end(),
        [](const LayerViolation& a, const LayerViolation& b) {
            if (a.from_layer != b.from_layer) return a.from_layer < b.from_layer;
            if (a.from_type != b.from_type) return a.from_type < b.from_type;
            return a.to_type < b.to_type;
        });
    m_violations.erase(std::unique(m_violations.begin(), m_violations.end()), m_violations.end());
}

bool ValidationReport::contains(const std::string& from, const std::string& to) const {
    return std::any_of(m_violations.begin(), m_violations.end(),
        [&](const LayerViolation& v) { return v.from_type == from && v.to_type == to; });
}

std::string ValidationReport::format() const {
    std::ostringstream oss;
    for (const auto& violation : m_violations) {
        oss << violation.format() << "\n";
    }
    return oss.str();
}

stratum_core::Result<void> ValidationReport::to_result() const {
    if (m_violations.empty()) {
        return stratum_core::Ok();
    }
    return stratum_core::Err(stratum_core::LayerViolationError::from_report(size(), format()));
}

// =============================================================================
// DependencyValidator
// =============================================================================

DependencyValidator::DependencyValidator()
    : m_registry(&LayerRegistry::canonical()) {}

DependencyValidator::DependencyValidator(const LayerRegistry& registry)
    : m_registry(&registry) {}

stratum_core::Result<std::optional<LayerViolation>> DependencyValidator::check_reference(
    const std::string& from, const std::string& to) const {

    using ResultType = stratum_core::Result<std::optional<LayerViolation>>;

    auto from_layer = m_registry->layer_of(from);
    if (!from_layer) {
        return ResultType(from_layer.error());
    }
    auto to_layer = m_registry->layer_of(to);
    if (!to_layer) {
        return ResultType(stratum_core::Error(to_layer.error())
            .with_context("referenced_by", from));
    }

    if (*to_layer < *from_layer) {
        return ResultType(std::optional<LayerViolation>{});
    }
    return ResultType(std::optional<LayerViolation>(
        LayerViolation{from, to, *from_layer, *to_layer}));
}

stratum_core::Result<ValidationReport> DependencyValidator::validate(
    const EntityTypeGraph& graph) const {

    STRATUM_LOG_SCOPE("DependencyValidator::validate", "validator");
    auto logger = stratum_core::validator_logger();

    std::vector<LayerViolation> violations;

    for (const auto& [name, decl] : graph.declarations()) {
        if (!m_registry->contains(name)) {
            return stratum_core::Err<ValidationReport>(
                stratum_core::RegistryError::unknown_type(name));
        }

        for (const auto& deferred : decl.deferred) {
            if (is_load_time_scope(deferred.scope)) {
                return stratum_core::Err<ValidationReport>(
                    stratum_core::DeferredError::invalid_scope(
                        name, deferred.to, reference_scope_name(deferred.scope)));
            }
        }

        for (const auto& ref : decl.eager) {
            auto checked = check_reference(name, ref);
            if (!checked) {
                return stratum_core::Err<ValidationReport>(checked.error());
            }
            if (checked->has_value()) {
                const auto& violation = **checked;
                stratum_core::log_structured(spdlog::level::warn, "validator",
                    "Eager reference breaks layer order", {
                        {"from", violation.from_type},
                        {"to", violation.to_type},
                        {"from_layer", std::to_string(violation.from_layer)},
                        {"to_layer", std::to_string(violation.to_layer)},
                    });
                violations.push_back(violation);
            }
        }
    }

    ValidationReport report(std::move(violations));
    if (report.empty()) {
        logger->debug("Validated {} types, {} eager references: no violations",
            graph.size(), graph.eager_count());
    } else {
        logger->error("Validated {} types: {} layer violation(s)", graph.size(), report.size());
    }

    return stratum_core::Ok(std::move(report));
}

stratum_core::Result<void> DependencyValidator::validate_or_error(
    const EntityTypeGraph& graph) const {

    auto report = validate(graph);
    if (!report) {
        return stratum_core::Err(report.error());
    }
    return report->to_result();
}

stratum_core::Result<ValidationReport> validate(const EntityTypeGraph& graph) {
    return DependencyValidator().validate(graph);
}

} // namespace stratum_layering
