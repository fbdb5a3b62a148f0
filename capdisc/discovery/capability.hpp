#pragma once

#include <string>
#include <vector>

namespace capdisc
{

/// Unordered collection of capability tokens advertised by one peer.
using CapabilitySet = std::vector<std::string>;

namespace feature
{
/// Audio RTP.
constexpr const char* audio = "urn:xmpp:jingle:apps:rtp:audio";
/// Video RTP.
constexpr const char* video = "urn:xmpp:jingle:apps:rtp:video";
/// ICE UDP transport.
constexpr const char* ice = "urn:xmpp:jingle:transports:ice-udp:1";
/// DTLS/SCTP transport.
constexpr const char* sctp = "urn:xmpp:jingle:transports:dtls-sctp:1";
/// RTX (RFC 4588).
constexpr const char* rtx = "urn:ietf:rfc:4588";
/// Jingle DTLS (XEP-0320).
constexpr const char* dtls = "urn:xmpp:jingle:apps:dtls:0";
/// RTCP mux (RFC 5761).
constexpr const char* rtcp_mux = "urn:ietf:rfc:5761";
/// RTP bundle (RFC 5888).
constexpr const char* rtp_bundle = "urn:ietf:rfc:5888";
constexpr const char* opus_red = "http://jitsi.org/opus-red";
/// Advertised by clients that support everything lip-sync needs.
constexpr const char* lipsync = "http://jitsi.org/meet/lipsync";
/// Marks a participant as a jigasi user.
constexpr const char* jigasi = "http://jitsi.org/protocol/jigasi";
/// Marks a (jigasi) participant that can be muted.
constexpr const char* audio_mute = "http://jitsi.org/protocol/audio-mute";
} // namespace feature

/// True if the token is one of the identifiers in capdisc::feature.
bool is_known_feature(const std::string& token);

/// True if the set contains the token.
bool has_feature(const CapabilitySet& capabilities, const std::string& token);

} // namespace capdisc
