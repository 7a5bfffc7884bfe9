#include "rejection_emitter.hpp"

#include "../common/debug/emit.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace hatchet::emit {

std::vector<RejectionRecord> RejectionEmitter::emit(const closure::ClosureResult& result) {
    debug::emit::log(debug::emit::Id::Start);

    std::vector<RejectionRecord> records;
    for (const auto& type : catalog_.all_types()) {
        if (result.classify_type(type) == closure::TypeDisposition::Rejected) {
            debug::emit::log(debug::emit::Id::RejectType, type, debug::Level::Trace);
            records.push_back(RejectionRecord::for_type(type));
            continue;
        }

        const closure::MemberSets* sets = result.kept_members(type);
        if (sets && sets->wildcard) {
            debug::emit::log(debug::emit::Id::WildcardType, type, debug::Level::Trace);
            continue;
        }
        for (const auto& member : catalog_.members(type)) {
            if (result.classify_member(type, member) != closure::MemberDisposition::Rejected)
                continue;
            debug::emit::log(debug::emit::Id::RejectMember, type + "." + member,
                             debug::Level::Trace);
            records.push_back(
                RejectionRecord::for_member(type, member, catalog_.member_kind(type, member)));
        }
    }

    std::sort(records.begin(), records.end());
    records.erase(std::unique(records.begin(), records.end()), records.end());

    RejectionSummary summary = summarize(records);
    debug::emit::log(debug::emit::Id::End, fmt::format("rejecting {} types, {} members",
                                                       summary.types, summary.members));
    return records;
}

RejectionSummary summarize(const std::vector<RejectionRecord>& records) {
    RejectionSummary summary;
    for (const auto& record : records) {
        if (record.is_type())
            ++summary.types;
        else
            ++summary.members;
    }
    return summary;
}

}  // namespace hatchet::emit
