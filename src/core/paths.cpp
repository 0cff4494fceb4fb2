#include "dirsync/core/paths.hpp"

#include <cstdint>

namespace dirsync {
namespace fs = std::filesystem;

bool is_valid_utf8(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t length = 0;
        std::uint32_t code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > text.size()) {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // Overlong forms, UTF-16 surrogates and values past U+10FFFF
        static const std::uint32_t minimum[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code_point < minimum[length] || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

PathMapper::PathMapper(fs::path root)
    : root_(fs::absolute(root).lexically_normal()) {
    // "dir/" normalises to "dir/" with an empty filename; drop it
    if (!root_.has_filename() && root_.has_relative_path()) {
        root_ = root_.parent_path();
    }
}

Result<std::string> PathMapper::normalize(const std::string& path) {
    if (path.empty()) {
        return Err<std::string>(std::string("Empty path"));
    }

    if (!is_valid_utf8(path)) {
        return Err<std::string>(std::string("Path is not valid UTF-8"));
    }

    std::string slashed = path;
    for (auto& ch : slashed) {
        if (ch == '\\') {
            ch = '/';
        }
    }

    const fs::path candidate(slashed);
    if (candidate.is_absolute() || candidate.has_root_name() || slashed.front() == '/') {
        return Err<std::string>(std::string("Path must be relative to the sync root: ") + path);
    }

    std::string normalized = candidate.lexically_normal().generic_string();
    while (!normalized.empty() && normalized.back() == '/') {
        normalized.pop_back();
    }

    if (normalized.empty() || normalized == ".") {
        return Err<std::string>(std::string("Path names the sync root itself: ") + path);
    }
    if (normalized == ".." || normalized.compare(0, 3, "../") == 0) {
        return Err<std::string>(std::string("Path escapes the sync root: ") + path);
    }
    return Ok(normalized);
}

Result<fs::path> PathMapper::to_local(const std::string& normalized) const {
    auto checked = normalize(normalized);
    if (checked.is_error()) {
        return Err<fs::path>(checked.error());
    }
    return Ok(root_ / fs::path(checked.value()));
}

Result<std::string> PathMapper::to_normalized(const fs::path& local) const {
    std::error_code ec;
    const fs::path absolute = fs::absolute(local, ec).lexically_normal();
    if (ec) {
        return Err<std::string>(std::string("Failed to resolve path: ") + local.string());
    }
    const fs::path relative = absolute.lexically_relative(root_);
    if (relative.empty()) {
        return Err<std::string>(std::string("Path is not under the sync root: ") + local.string());
    }
    return normalize(relative.generic_string());
}

} // namespace dirsync
