/**
 * @file mount_translator.cpp
 * @brief Implementation of the bind string codec
 *
 * @date 2025
 */

#include "dockhand/utils/mount_translator.hpp"
#include "dockhand/utils/string_utils.hpp"
#include "dockhand/core/errors.hpp"

#include <algorithm>
#include <optional>

namespace dockhand {
namespace utils {

using core::EngineError;
using core::ErrorKind;
using core::MountDescriptor;
using core::MountKind;
using core::MountMode;

MountDescriptor MountTranslator::Decode(const std::string& bind_string) {
    auto segments = StringUtils::Split(bind_string, ':');

    if (segments.size() < 2) {
        throw EngineError(ErrorKind::MALFORMED_MOUNT_SPEC,
                          "Mount spec '" + bind_string + "' needs source:destination");
    }
    if (segments.size() > 3) {
        throw EngineError(ErrorKind::MALFORMED_MOUNT_SPEC,
                          "Mount spec '" + bind_string + "' has too many ':' segments");
    }

    MountDescriptor mount;
    mount.source = segments[0];
    mount.destination = segments[1];

    if (mount.source.empty()) {
        throw EngineError(ErrorKind::MALFORMED_MOUNT_SPEC,
                          "Mount spec '" + bind_string + "' has an empty source");
    }
    if (!StringUtils::StartsWith(mount.destination, "/")) {
        throw EngineError(ErrorKind::MALFORMED_MOUNT_SPEC,
                          "Mount destination '" + mount.destination + "' is not absolute");
    }

    if (segments.size() == 3) {
        ParseModeSegment(segments[2], mount);
    }
    mount.kind = KindForSource(mount.source);

    return mount;
}

std::string MountTranslator::Encode(const MountDescriptor& mount) {
    std::string bind = mount.source + ":" + mount.destination;
    std::vector<std::string> options;
    if (mount.mode != MountMode::READ_WRITE) {
        options.push_back(ModeToString(mount.mode));
    }
    if (!mount.options.empty()) {
        options.push_back(mount.options);
    }
    if (!options.empty()) {
        bind += ":" + StringUtils::Join(options, ",");
    }
    return bind;
}

bool MountTranslator::HasConflict(const std::vector<MountDescriptor>& existing,
                                  const MountDescriptor& candidate) {
    return std::any_of(existing.begin(), existing.end(),
                       [&](const MountDescriptor& m) { return m.source == candidate.source; });
}

bool MountTranslator::HasDestinationConflict(const std::vector<MountDescriptor>& existing,
                                             const MountDescriptor& candidate) {
    return std::any_of(existing.begin(), existing.end(),
                       [&](const MountDescriptor& m) {
                           return m.destination == candidate.destination;
                       });
}

MountMode MountTranslator::ParseMode(const std::string& mode) {
    if (mode == "rw") {
        return MountMode::READ_WRITE;
    }
    if (mode == "ro") {
        return MountMode::READ_ONLY;
    }
    throw EngineError(ErrorKind::MALFORMED_MOUNT_SPEC, "Unknown mount mode '" + mode + "'");
}

void MountTranslator::ParseModeSegment(const std::string& segment, MountDescriptor& mount) {
    // "ro,z" / "rw,Z,nocopy" / "rshared": rw or ro set the mode, the rest
    // (relabel, propagation, nocopy) is kept verbatim for the runtime
    std::optional<MountMode> access;
    std::vector<std::string> options;

    for (const auto& option : StringUtils::Split(segment, ',')) {
        if (option.empty()) {
            continue;
        }
        if (option != "rw" && option != "ro") {
            options.push_back(option);
            continue;
        }
        MountMode current = ParseMode(option);
        if (access && *access != current) {
            throw EngineError(ErrorKind::MALFORMED_MOUNT_SPEC,
                              "Mount mode '" + segment + "' is both rw and ro");
        }
        access = current;
    }

    mount.mode = access.value_or(MountMode::READ_WRITE);
    mount.options = StringUtils::Join(options, ",");
}

std::string MountTranslator::ModeToString(MountMode mode) {
    return mode == MountMode::READ_ONLY ? "ro" : "rw";
}

MountKind MountTranslator::KindForSource(const std::string& source) {
    if (StringUtils::StartsWith(source, "/") ||
        StringUtils::StartsWith(source, ".") ||
        StringUtils::StartsWith(source, "~")) {
        return MountKind::BIND;
    }
    return MountKind::NAMED_VOLUME;
}

} // namespace utils
} // namespace dockhand
