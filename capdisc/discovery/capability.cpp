#include "capdisc/discovery/capability.hpp"

#include <algorithm>
#include <array>

namespace capdisc
{

bool is_known_feature(const std::string& token)
{
    static const std::array<const char*, 12> known {feature::audio,    feature::video,      feature::ice,      feature::sctp,
                                                    feature::rtx,      feature::dtls,       feature::rtcp_mux, feature::rtp_bundle,
                                                    feature::opus_red, feature::lipsync,    feature::jigasi,   feature::audio_mute};

    return std::any_of(known.begin(), known.end(), [&token](const char* name) { return token == name; });
}

bool has_feature(const CapabilitySet& capabilities, const std::string& token)
{
    return std::find(capabilities.begin(), capabilities.end(), token) != capabilities.end();
}

} // namespace capdisc
