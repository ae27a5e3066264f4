/**
 * @file container_spec.hpp
 * @brief Declared container configuration model used by the recreation engine
 *
 * A ContainerSpec is the desired declared state of a container: the fields a
 * recreation has to carry over from the old container to its replacement.
 * Specs are built once per reconfiguration call and never mutated afterwards.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>

#include <nlohmann/json_fwd.hpp>

namespace dockhand {
namespace core {

/**
 * @enum MountMode
 * @brief Access mode of a mount inside the container
 */
enum class MountMode {
    READ_WRITE,   ///< Default mode ("rw")
    READ_ONLY     ///< Read-only ("ro")
};

/**
 * @enum MountKind
 * @brief Backing store of a mount
 */
enum class MountKind {
    BIND,          ///< Host filesystem path
    NAMED_VOLUME   ///< Runtime-managed volume
};

/**
 * @enum ContainerState
 * @brief Runtime lifecycle states
 */
enum class ContainerState {
    CREATED,     ///< Created but never started
    RUNNING,     ///< Running
    PAUSED,      ///< Paused (frozen cgroup)
    RESTARTING,  ///< Restart policy in progress
    EXITED,      ///< Exited
    REMOVING,    ///< Removal in progress
    DEAD,        ///< Dead (failed removal)
    UNKNOWN      ///< Unrecognized state string
};

/**
 * @struct MountDescriptor
 * @brief One mount of a container
 */
struct MountDescriptor {
    std::string source;                     ///< Host path or volume name
    std::string destination;                ///< Absolute path inside container
    MountMode mode{MountMode::READ_WRITE};  ///< Access mode
    MountKind kind{MountKind::BIND};        ///< Bind mount or named volume
    std::string options;                    ///< Extra bind options ("z", "rshared,nocopy")

    bool operator==(const MountDescriptor& other) const {
        return source == other.source && destination == other.destination &&
               mode == other.mode && kind == other.kind && options == other.options;
    }
    bool operator!=(const MountDescriptor& other) const { return !(*this == other); }
};

/**
 * @struct PortBinding
 * @brief Host side of a published port
 */
struct PortBinding {
    std::string host_ip;    ///< Host interface ("" = all interfaces)
    std::string host_port;  ///< Host port ("" = runtime-assigned)

    bool operator==(const PortBinding& other) const {
        return host_ip == other.host_ip && host_port == other.host_port;
    }
    bool operator!=(const PortBinding& other) const { return !(*this == other); }
};

/// Container port spec ("80/tcp") to host bindings
using PortMap = std::map<std::string, std::vector<PortBinding>>;

/**
 * @struct ContainerSpec
 * @brief Desired declared state of a container
 *
 * The first network is the primary one: it is attached when the container is
 * created, every other network is connected afterwards. Mount destinations
 * are unique within a spec (see ValidateSpec).
 *
 * `labels` and `restart_policy` are carried over unchanged from the old
 * container; a patch cannot change them.
 */
struct ContainerSpec {
    std::string image;                           ///< Image reference
    std::vector<std::string> environment;        ///< "KEY=VALUE" entries, ordered
    std::vector<MountDescriptor> mounts;         ///< Mounts, unique destinations
    std::vector<std::string> networks;           ///< Network names, primary first
    PortMap ports;                               ///< Published ports
    std::map<std::string, std::string> labels;   ///< Container labels
    std::string restart_policy;                  ///< "no", "always", "on-failure:3", ...

    bool operator==(const ContainerSpec& other) const {
        return image == other.image && environment == other.environment &&
               mounts == other.mounts && networks == other.networks &&
               ports == other.ports && labels == other.labels &&
               restart_policy == other.restart_policy;
    }
    bool operator!=(const ContainerSpec& other) const { return !(*this == other); }
};

/**
 * @struct PartialContainerSpec
 * @brief Caller's update request; every field is independently optional
 */
struct PartialContainerSpec {
    std::optional<std::string> image;
    std::optional<std::vector<std::string>> environment;
    std::optional<std::vector<MountDescriptor>> mounts;
    std::optional<std::vector<std::string>> networks;
    std::optional<PortMap> ports;

    bool Empty() const {
        return !image && !environment && !mounts && !networks && !ports;
    }
};

/**
 * @struct ContainerSnapshot
 * @brief Declared configuration of an existing container plus its identity
 */
struct ContainerSnapshot {
    std::string id;                              ///< Runtime id (unstable across updates)
    std::string name;                            ///< Name, without leading '/'
    ContainerState state{ContainerState::UNKNOWN};
    ContainerSpec spec;

    /// Running, restarting and paused containers must be stopped before removal
    bool WasRunning() const {
        return state == ContainerState::RUNNING ||
               state == ContainerState::RESTARTING ||
               state == ContainerState::PAUSED;
    }
};

/**
 * @brief Check spec invariants
 *
 * @throws EngineError INVALID_SPEC for an empty image,
 *         MALFORMED_MOUNT_SPEC for two mounts with the same destination
 */
void ValidateSpec(const ContainerSpec& spec);

ContainerState ParseContainerState(const std::string& state_str);
std::string ContainerStateToString(ContainerState state);

/**
 * @class ContainerSpecBuilder
 * @brief Fluent API for building container specs
 *
 * @code
 * auto spec = ContainerSpecBuilder()
 *     .WithImage("nginx:1.25")
 *     .WithEnvironment("MODE", "prod")
 *     .WithNetwork("frontend")
 *     .WithNetwork("backend")
 *     .WithPort("80/tcp", {"", "8080"})
 *     .Build();
 * @endcode
 */
class ContainerSpecBuilder {
public:
    ContainerSpecBuilder() = default;
    explicit ContainerSpecBuilder(ContainerSpec base);

    ContainerSpecBuilder& WithImage(const std::string& image);
    ContainerSpecBuilder& WithEnvironment(const std::string& key,
                                          const std::string& value);
    ContainerSpecBuilder& WithMount(const MountDescriptor& mount);
    ContainerSpecBuilder& WithNetwork(const std::string& network);
    ContainerSpecBuilder& WithPort(const std::string& container_port,
                                   const PortBinding& binding);
    ContainerSpecBuilder& WithLabel(const std::string& key,
                                    const std::string& value);
    ContainerSpecBuilder& WithRestartPolicy(const std::string& policy);

    /// @throws EngineError when the result violates ValidateSpec
    ContainerSpec Build() const;

private:
    ContainerSpec spec_;  ///< Spec being built
};

void to_json(nlohmann::json& j, const MountDescriptor& mount);
void to_json(nlohmann::json& j, const ContainerSpec& spec);
void to_json(nlohmann::json& j, const ContainerSnapshot& snapshot);

} // namespace core
} // namespace dockhand
