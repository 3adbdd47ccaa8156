#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include "rules.hpp"
#include "sequence_counter.hpp"
#include "logging.hpp"

namespace RecordForge {

struct GenerationConfig {
    std::string email_prefix = "random";
    std::string email_domain = "example.com";
    std::string string_prefix = "arbitrary";
};

/// Everything generation shares between calls: the counter, the custom rules and the
/// text configuration. Generate() may be called concurrently on one context; rule
/// registration may not overlap with generation.
class GenerationContext {
    SequenceCounter m_counter;
    RuleSet m_rules;
    GenerationConfig m_config;

public:
    explicit GenerationContext(std::int64_t counterStart = 0, GenerationConfig config = {}):
        m_counter(counterStart), m_config(std::move(config))
    {}

    explicit GenerationContext(GenerationConfig config):
        GenerationContext(0, std::move(config))
    {}

    GenerationContext(const GenerationContext&) = delete;
    GenerationContext& operator=(const GenerationContext&) = delete;

    SequenceCounter & counter() { return m_counter; }
    const RuleSet & rules() const { return m_rules; }
    const GenerationConfig & config() const { return m_config; }

    GenerationContext & registerRule(RuleMatcher matcher, RuleProducer producer, std::string label = {}) {
        if(label.empty()) {
            label = "custom#" + std::to_string(m_rules.size() + 1);
        }
        logging::logger()->debug("registered rule '{}' (priority {})", label, m_rules.size() + 1);
        m_rules.add(CustomRule{std::move(label), std::move(matcher), std::move(producer)});
        return *this;
    }

    template<class V>
    GenerationContext & registerRule(RuleMatcher matcher,
                                     std::function<V(const FieldInfo&, SequenceCounter&)> producer,
                                     std::string label = {}) {
        return registerRule(std::move(matcher),
                            [p = std::move(producer)](const FieldInfo & f, SequenceCounter & c) -> std::any {
                                return std::any(p(f, c));
                            },
                            std::move(label));
    }
};

/// Context used when none is passed. Lives for the whole process, so values stay unique
/// across all such calls.
inline GenerationContext & default_context() {
    static GenerationContext ctx;
    return ctx;
}

} // namespace RecordForge
