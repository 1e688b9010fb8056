#include "scan/provenance.hpp"
#include "core/config.hpp"
#include <utility>

namespace leakscan {
namespace scan {

const std::string KEY_SEPARATOR = "__";
const std::string SLASH_TOKEN = "__SLASH__";
const std::string DOT_TOKEN = "__DOT__";
const std::string PRIVATE_KEY_MARKER = "PRIVATE_KEY_CONTENT";

namespace {

const std::vector<std::pair<char, std::string>>& valueTokens() {
    static const std::vector<std::pair<char, std::string>> tokens = {
        {'=', "__EQ__"},
        {'#', "__HASH__"},
        {'"', "__QUOTE__"},
        {'\'', "__APOS__"},
        {' ', "__SPACE__"},
    };
    return tokens;
}

const char HEX_DIGITS[] = "0123456789ABCDEF";

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool isControlByte(unsigned char c) {
    return c < 0x20 || c == 0x7f;
}

std::string withLeadingSlash(const std::string& path) {
    if (path.empty() || path.front() == '/') {
        return path;
    }
    return "/" + path;
}

// A separator directly followed by the tail of a path token belongs to that
// token, so the match is not a path/secret boundary.
bool isTokenContinuation(const std::string& text, size_t pos) {
    static const std::string slashTail = SLASH_TOKEN.substr(KEY_SEPARATOR.size());
    static const std::string dotTail = DOT_TOKEN.substr(KEY_SEPARATOR.size());
    return text.compare(pos, slashTail.size(), slashTail) == 0 ||
           text.compare(pos, dotTail.size(), dotTail) == 0;
}

// Finds the first usable occurrence of the first anchor that occurs.
// Returns the end of the encoded path (separator excluded) and the start of
// the secret name.
bool splitAtAnchors(const std::string& rest, const std::vector<std::string>& fileNames,
                    size_t& pathEnd, size_t& secretStart) {
    for (const auto& fileName : fileNames) {
        std::string anchor = encodePath("/" + fileName) + KEY_SEPARATOR;
        size_t pos = rest.find(anchor);
        while (pos != std::string::npos) {
            size_t after = pos + anchor.size();
            if (!isTokenContinuation(rest, after)) {
                pathEnd = after - KEY_SEPARATOR.size();
                secretStart = after;
                return true;
            }
            pos = rest.find(anchor, pos + 1);
        }
    }
    return false;
}

const std::vector<std::string>& envFileAnchors() {
    static const std::vector<std::string> anchors = {".env.production", ".env.test", ".env"};
    return anchors;
}

const std::vector<std::string>& npmrcAnchors() {
    static const std::vector<std::string> anchors = {".npmrc"};
    return anchors;
}

DecodedKey decodeFileKey(SourceKind kind, const std::string& rest) {
    DecodedKey decoded;
    decoded.kind = kind;
    decoded.kindKnown = true;

    if (kind == SourceKind::PrivateKeyFile) {
        std::string suffix = KEY_SEPARATOR + PRIVATE_KEY_MARKER;
        if (core::endsWith(rest, suffix)) {
            decoded.path = withLeadingSlash(decodePath(rest.substr(0, rest.size() - suffix.size())));
            decoded.secretName = PRIVATE_KEY_MARKER;
            decoded.confidence = DecodeConfidence::Exact;
        } else {
            decoded.path = withLeadingSlash(decodePath(rest));
            decoded.confidence = DecodeConfidence::Unanchored;
        }
        return decoded;
    }

    const auto& anchors = kind == SourceKind::NpmrcFile ? npmrcAnchors() : envFileAnchors();
    size_t pathEnd = 0;
    size_t secretStart = 0;
    if (splitAtAnchors(rest, anchors, pathEnd, secretStart)) {
        decoded.path = withLeadingSlash(decodePath(rest.substr(0, pathEnd)));
        decoded.secretName = decodeKeyValue(rest.substr(secretStart));
        decoded.confidence = DecodeConfidence::Anchored;
    } else {
        decoded.path = withLeadingSlash(decodePath(rest));
        decoded.confidence = DecodeConfidence::Unanchored;
    }
    return decoded;
}

// The key lost its tag: rebuild an env-file path from what is left.
DecodedKey guessFromPathTokens(const std::string& name) {
    DecodedKey decoded;
    decoded.kind = SourceKind::EnvFile;
    decoded.kindKnown = true;
    decoded.confidence = DecodeConfidence::Guessed;

    std::string full = withLeadingSlash(decodePath(name));
    std::string path = full;

    const std::string envPattern = "/.env";
    size_t envIdx = full.rfind(envPattern);
    if (envIdx != std::string::npos) {
        size_t next = envIdx + envPattern.size();
        if (next < full.size()) {
            std::string remaining = full.substr(next);
            if (remaining.front() == '.') {
                // .env.production_... : the suffix runs up to the separator
                size_t sep = remaining.find('_');
                if (sep != std::string::npos) {
                    path = full.substr(0, next + sep);
                }
            } else {
                path = full.substr(0, next);
            }
        }
    }

    decoded.path = path;
    size_t secretStart = path.size();
    while (secretStart < full.size() && full[secretStart] == '_') {
        ++secretStart;
    }
    decoded.secretName = decodeKeyValue(full.substr(secretStart));
    return decoded;
}

} // namespace

const std::vector<SourceKind>& allSourceKinds() {
    static const std::vector<SourceKind> kinds = {
        SourceKind::EnvironmentVariable,
        SourceKind::GithubToken,
        SourceKind::NpmrcFile,
        SourceKind::EnvFile,
        SourceKind::PrivateKeyFile,
    };
    return kinds;
}

std::string sourceTag(SourceKind kind) {
    switch (kind) {
    case SourceKind::EnvironmentVariable: return "ENVIRONMENT_VAR";
    case SourceKind::GithubToken:         return "GITHUB_TOKEN";
    case SourceKind::NpmrcFile:           return "NPMRC_HOME";
    case SourceKind::EnvFile:             return "ENV_FILE";
    case SourceKind::PrivateKeyFile:      return "PRIVATE_KEY";
    }
    return "UNKNOWN";
}

std::optional<SourceKind> sourceKindFromTag(const std::string& tag) {
    for (SourceKind kind : allSourceKinds()) {
        if (sourceTag(kind) == tag) {
            return kind;
        }
    }
    return std::nullopt;
}

std::string sourceLabel(SourceKind kind) {
    switch (kind) {
    case SourceKind::EnvironmentVariable: return "Environment variable";
    case SourceKind::GithubToken:         return "GitHub Token";
    case SourceKind::NpmrcFile:           return "Configuration file";
    case SourceKind::EnvFile:             return "Environment file";
    case SourceKind::PrivateKeyFile:      return "Private key file";
    }
    return "Unknown";
}

bool hasFilePath(SourceKind kind) {
    return kind == SourceKind::NpmrcFile || kind == SourceKind::EnvFile ||
           kind == SourceKind::PrivateKeyFile;
}

std::string encodePath(const std::string& path) {
    std::string encoded;
    encoded.reserve(path.size() * 2);
    for (char c : path) {
        if (c == '/') {
            encoded += SLASH_TOKEN;
        } else if (c == '.') {
            encoded += DOT_TOKEN;
        } else {
            encoded.push_back(c);
        }
    }
    return encoded;
}

std::string decodePath(const std::string& encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());
    size_t i = 0;
    while (i < encoded.size()) {
        if (encoded.compare(i, SLASH_TOKEN.size(), SLASH_TOKEN) == 0) {
            decoded.push_back('/');
            i += SLASH_TOKEN.size();
        } else if (encoded.compare(i, DOT_TOKEN.size(), DOT_TOKEN) == 0) {
            decoded.push_back('.');
            i += DOT_TOKEN.size();
        } else {
            decoded.push_back(encoded[i]);
            ++i;
        }
    }
    return decoded;
}

std::string encodeKeyValue(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size());
    for (char c : value) {
        bool replaced = false;
        for (const auto& token : valueTokens()) {
            if (c == token.first) {
                encoded += token.second;
                replaced = true;
                break;
            }
        }
        if (replaced) {
            continue;
        }
        auto byte = static_cast<unsigned char>(c);
        if (isControlByte(byte)) {
            encoded += "__X";
            encoded.push_back(HEX_DIGITS[byte >> 4]);
            encoded.push_back(HEX_DIGITS[byte & 0x0f]);
            encoded += KEY_SEPARATOR;
        } else {
            encoded.push_back(c);
        }
    }
    return encoded;
}

std::string decodeKeyValue(const std::string& encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());
    size_t i = 0;
    while (i < encoded.size()) {
        bool matched = false;
        for (const auto& token : valueTokens()) {
            if (encoded.compare(i, token.second.size(), token.second) == 0) {
                decoded.push_back(token.first);
                i += token.second.size();
                matched = true;
                break;
            }
        }
        if (matched) {
            continue;
        }
        // __X<hi><lo>__
        if (encoded.compare(i, 3, "__X") == 0 && i + 7 <= encoded.size() &&
            encoded.compare(i + 5, 2, KEY_SEPARATOR) == 0) {
            int hi = hexValue(encoded[i + 3]);
            int lo = hexValue(encoded[i + 4]);
            if (hi >= 0 && lo >= 0) {
                decoded.push_back(static_cast<char>(hi * 16 + lo));
                i += 7;
                continue;
            }
        }
        decoded.push_back(encoded[i]);
        ++i;
    }
    return decoded;
}

std::string makeKey(const Origin& origin, const std::string& valueOrMarker) {
    std::string key = sourceTag(origin.kind) + KEY_SEPARATOR;
    if (hasFilePath(origin.kind)) {
        key += encodePath(origin.path) + KEY_SEPARATOR;
    }
    return key + encodeKeyValue(valueOrMarker);
}

std::string confidenceName(DecodeConfidence confidence) {
    switch (confidence) {
    case DecodeConfidence::Exact:      return "exact";
    case DecodeConfidence::Anchored:   return "anchored";
    case DecodeConfidence::Unanchored: return "unanchored";
    case DecodeConfidence::Guessed:    return "guessed";
    case DecodeConfidence::Unknown:    return "unknown";
    }
    return "unknown";
}

DecodedKey decodeKey(const std::string& name) {
    size_t sep = name.find(KEY_SEPARATOR);
    std::string tag = sep == std::string::npos ? name : name.substr(0, sep);
    std::string rest = sep == std::string::npos ? "" : name.substr(sep + KEY_SEPARATOR.size());

    auto kind = sourceKindFromTag(tag);
    if (kind) {
        if (hasFilePath(*kind)) {
            return decodeFileKey(*kind, rest);
        }
        DecodedKey decoded;
        decoded.kind = *kind;
        decoded.kindKnown = true;
        decoded.path = *kind == SourceKind::GithubToken ? "gh auth token" : "os.environ";
        decoded.secretName = decodeKeyValue(rest);
        decoded.confidence = DecodeConfidence::Exact;
        return decoded;
    }

    if (name.find(SLASH_TOKEN) != std::string::npos || name.find(DOT_TOKEN) != std::string::npos) {
        return guessFromPathTokens(name);
    }

    DecodedKey decoded;
    decoded.path = sep == std::string::npos ? "" : tag;
    decoded.secretName = sep == std::string::npos ? name : rest;
    return decoded;
}

} // namespace scan
} // namespace leakscan
