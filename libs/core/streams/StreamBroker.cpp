#include "streams/StreamBroker.hpp"
#include <charconv>

namespace Rampart {

std::string StreamEntryId::toString() const {
    return std::to_string(ms) + "-" + std::to_string(seq);
}

std::optional<StreamEntryId> StreamEntryId::parse(std::string_view s) {
    const auto dash = s.find('-');
    const auto msPart = s.substr(0, dash);
    StreamEntryId id;

    auto [p1, ec1] = std::from_chars(msPart.data(), msPart.data() + msPart.size(), id.ms);
    if (ec1 != std::errc() || p1 != msPart.data() + msPart.size() || msPart.empty()) return std::nullopt;

    if (dash == std::string_view::npos) return id;
    const auto seqPart = s.substr(dash + 1);
    auto [p2, ec2] = std::from_chars(seqPart.data(), seqPart.data() + seqPart.size(), id.seq);
    if (ec2 != std::errc() || p2 != seqPart.data() + seqPart.size() || seqPart.empty()) return std::nullopt;
    return id;
}

} // namespace Rampart
