/**
 * @file mount_translator.hpp
 * @brief Conversion between MountDescriptor and the runtime's bind strings
 *
 * The runtime stores bind mounts and named volumes as colon-delimited strings:
 *
 * ```
 * /srv/data:/data          bind, read-write
 * /srv/data:/data:ro       bind, read-only
 * pgdata:/var/lib/pg:rw    named volume, read-write
 * /srv/data:/data:ro,z     bind, read-only, SELinux relabel
 * pgdata:/data:nocopy      named volume, read-write, no copy-up
 * ```
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/container_spec.hpp"

#include <string>
#include <vector>

namespace dockhand {
namespace utils {

/**
 * @class MountTranslator
 * @brief Bind string codec and mount conflict checks
 */
class MountTranslator {
public:
    /**
     * @brief Parse "source:destination[:mode]"
     *
     * Mode defaults to read-write. The third segment is a comma list of
     * options ("ro,z", "rshared", "nocopy"): "rw"/"ro" decide the mode, any
     * other option is kept in MountDescriptor::options. Sources that look
     * like paths ('/', '.', '~') are bind mounts, anything else is a named
     * volume.
     *
     * @throws core::EngineError MALFORMED_MOUNT_SPEC on fewer than 2 or more
     *         than 3 segments, an empty source, a relative destination or a
     *         segment holding both "rw" and "ro"
     */
    static core::MountDescriptor Decode(const std::string& bind_string);

    /// Inverse of Decode; "rw" is omitted, other options are appended after the mode
    static std::string Encode(const core::MountDescriptor& mount);

    /// True if any existing mount has the candidate's source
    static bool HasConflict(const std::vector<core::MountDescriptor>& existing,
                            const core::MountDescriptor& candidate);

    /// True if any existing mount targets the candidate's destination
    static bool HasDestinationConflict(const std::vector<core::MountDescriptor>& existing,
                                       const core::MountDescriptor& candidate);

    /// Parse exactly "rw" or "ro"
    static core::MountMode ParseMode(const std::string& mode);

    static std::string ModeToString(core::MountMode mode);

    /// Bind for path-like sources, named volume otherwise
    static core::MountKind KindForSource(const std::string& source);

private:
    static void ParseModeSegment(const std::string& segment, core::MountDescriptor& mount);
};

} // namespace utils
} // namespace dockhand
