#pragma once

#include <optional>
#include <string>
#include <vector>

namespace leakscan {
namespace scan {

// Where a secret value was found.
enum class SourceKind {
    EnvironmentVariable,
    GithubToken,
    NpmrcFile,
    EnvFile,
    PrivateKeyFile
};

// Origin of a value. path is empty for EnvironmentVariable and GithubToken.
struct Origin {
    SourceKind kind = SourceKind::EnvironmentVariable;
    std::string path;
};

// Key layout: <tag>__<encoded path>__<value or marker>, or <tag>__<value>
// for kinds without a file.
extern const std::string KEY_SEPARATOR;
extern const std::string SLASH_TOKEN;
extern const std::string DOT_TOKEN;
extern const std::string PRIVATE_KEY_MARKER;

const std::vector<SourceKind>& allSourceKinds();
std::string sourceTag(SourceKind kind);
std::optional<SourceKind> sourceKindFromTag(const std::string& tag);
std::string sourceLabel(SourceKind kind);
bool hasFilePath(SourceKind kind);

// Path encoding: '/' -> __SLASH__, '.' -> __DOT__
std::string encodePath(const std::string& path);
std::string decodePath(const std::string& encoded);

// Value segment encoding, so a key stays one NAME token on one line:
// '=' -> __EQ__, '#' -> __HASH__, '"' -> __QUOTE__, '\'' -> __APOS__,
// ' ' -> __SPACE__, other control bytes -> __X<hex>__ (e.g. \n -> __X0A__).
std::string encodeKeyValue(const std::string& value);
std::string decodeKeyValue(const std::string& encoded);

// Builds the flat key that identifies a value and its origin. The value is
// passed through encodeKeyValue.
std::string makeKey(const Origin& origin, const std::string& valueOrMarker);

// How much of a decoded key could be trusted. Token decoding is greedy and
// left to right, so text that was never a token can still decode as one:
// the path "/x__DOT_." encodes to "__SLASH__x__DOT___DOT__" and decodes back
// as "/x._DOT__". Exact therefore means the key structure was recognised,
// not that every segment is the original byte for byte.
enum class DecodeConfidence {
    Exact,      // key was complete and unambiguous
    Anchored,   // path/secret boundary found at a known file-name anchor
    Unanchored, // no boundary found, the whole remainder is the path
    Guessed,    // kind tag lost, origin reconstructed from path tokens
    Unknown
};

std::string confidenceName(DecodeConfidence confidence);

struct DecodedKey {
    SourceKind kind = SourceKind::EnvironmentVariable;
    bool kindKnown = false;
    std::string path;        // decoded file path, or a descriptor for path-less kinds
    std::string secretName;  // part of the key after the path
    DecodeConfidence confidence = DecodeConfidence::Unknown;
};

// Best-effort inverse of makeKey for names that may have been cut short by
// the checker. Anchor priority for env files is .env.production, .env.test,
// then .env; the first anchor that occurs wins.
DecodedKey decodeKey(const std::string& name);

} // namespace scan
} // namespace leakscan
