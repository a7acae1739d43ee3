/**
 * Rule Validation Example
 *
 * Demonstrates layered rule validation:
 * - Loading rules and facts into named layers
 * - Enabling layers and validating proposed edges
 * - Reading decisions, why-traces and suggestions
 */

#include <hgreason/hgreason.hpp>
#include <iostream>

using namespace hgreason;

namespace {

Attributes rule_attrs(const std::string& layer, bool mandatory, const std::string& source) {
    Attributes attrs;
    attrs.set(Attributes::LAYER, layer);
    attrs.set(Attributes::MANDATORY, mandatory);
    attrs.set(Attributes::SOURCE, source);
    return attrs;
}

void print_report(const ValidationReport& report) {
    std::cout << "  Decision: " << to_string(report.decision)
              << " (" << report.rules_checked << " rules checked)\n";

    for (const auto* group : {&report.kept, &report.rejected, &report.unknown}) {
        for (const auto& verdict : *group) {
            std::cout << "    " << verdict.edge_str() << " -> " << to_string(verdict.decision()) << "\n";

            if (const auto* denied = std::get_if<Denied>(&verdict.outcome)) {
                std::cout << "      reason: " << denied->reason << "\n";
            }
            if (const auto* undetermined = std::get_if<Undetermined>(&verdict.outcome)) {
                std::cout << "      reason: " << undetermined->reason << "\n";
                for (const auto& suggestion : undetermined->suggestions) {
                    std::cout << "      nearest rule: " << suggestion.rule
                              << " (overlap " << suggestion.overlap << ", missing";
                    for (const auto& atom : suggestion.missing_concepts) {
                        std::cout << " " << atom;
                    }
                    std::cout << ")\n";
                }
            }
            for (const auto& entry : verdict.why_trace) {
                std::cout << "      because " << entry.rule << " [" << entry.layer;
                if (entry.source) std::cout << ", " << *entry.source;
                if (entry.mandatory) std::cout << ", mandatory";
                std::cout << "]\n";
            }
        }
    }
    std::cout << "\n";
}

} // namespace

int main() {
    std::cout << "=== Rule Validation Example ===\n\n";

    MemoryStore store;
    store.add("(contraindicated/P ibuprofen/C diabetes/C)", rule_attrs("foundation", true, "drug-label"));
    store.add("(treats/P ibuprofen/C pain/C)", rule_attrs("foundation", false, "drug-label"));
    store.add("(treats/P paracetamol/C fever/C)", rule_attrs("foundation", false, "drug-label"));
    std::cout << "Loaded " << store.size() << " foundation rules\n\n";

    Engine engine(store);

    std::cout << "No layers enabled:\n";
    print_report(engine.validate(std::vector<std::string>{"(takes/P patient/C ibuprofen/C)"}));

    engine.layers().enable("foundation");
    std::cout << "Foundation enabled:\n";
    print_report(engine.validate(std::vector<std::string>{
        "(give/P ibuprofen/C pain/C)",
        "(takes/P patient/C ibuprofen/C)"}));

    // A user fact links the patient to the contraindicated condition
    store.add("(has/P patient/C diabetes/C)", rule_attrs("user", false, "intake-form"));
    engine.layers().enable("user");
    std::cout << "User condition recorded:\n";
    print_report(engine.validate(std::vector<std::string>{"(takes/P patient/C ibuprofen/C)"}));

    std::cout << "Same proposal with only the user layer, as a one-off override:\n";
    print_report(engine.validate(std::vector<std::string>{"(takes/P patient/C ibuprofen/C)"},
                                 std::nullopt, LayerSet{"user"}));

    try {
        engine.validate(std::vector<std::string>{"(takes/P patient/C"});
    } catch (const ParseError& e) {
        std::cout << "Malformed proposal rejected: " << e.what()
                  << " (position " << e.position() << ")\n";
    }

    return 0;
}
