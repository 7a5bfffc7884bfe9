#include "code_unit.hpp"

#include "../common/debug/harvest.hpp"

namespace hatchet::harvest {

void collect_identifiers(const CodeUnit& root, IdentifierSet& ids) {
    // 明示的なスタックで走査（ネストの深さに依存しない）
    std::vector<const CodeUnit*> stack;
    stack.push_back(&root);

    while (!stack.empty()) {
        const CodeUnit* unit = stack.back();
        stack.pop_back();

        for (const auto& name : unit->referenced_names()) {
            ids.insert(name);
        }
        for (const auto& constant : unit->string_constants()) {
            if (is_identifier(constant)) {
                if (ids.insert(constant).second) {
                    debug::harvest::log(debug::harvest::Id::ConstantFound, constant,
                                        debug::Level::Trace);
                }
            }
        }
        for (const CodeUnit* nested : unit->nested_units()) {
            debug::harvest::log(debug::harvest::Id::NestedUnit, nested->name(),
                                debug::Level::Trace);
            stack.push_back(nested);
        }
    }
}

}  // namespace hatchet::harvest
