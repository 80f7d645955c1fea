#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/store/object_store.hpp"
#include "flowcore/store/serializer.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace flowcore {

inline constexpr std::string_view kArtifactMetadataFile = ".artifact.json";
inline constexpr std::string_view kArtifactObjectFile = "object";

struct ArtifactMetadata {
  std::string name;
  std::string ns;
  std::string value_type;
  std::string serializer;
  bool committed{false};
  std::vector<std::string> files;
  std::string created_at;
  std::string updated_at;
};

[[nodiscard]] auto is_valid_artifact_name(std::string_view name) -> bool;

class ArtifactStore;

// Buffers file writes for one artifact and publishes them on commit().
//
// Metadata is written with committed=false before any file lands and flipped
// to committed=true only after every file is renamed into place, so a reader
// can tell an interrupted write from a finished one. Destroying an open
// session commits it on normal scope exit and abandons it during stack
// unwinding.
class ArtifactWriteSession {
public:
  ArtifactWriteSession(const ArtifactWriteSession &) = delete;
  ArtifactWriteSession &operator=(const ArtifactWriteSession &) = delete;
  ArtifactWriteSession(ArtifactWriteSession &&other) noexcept;
  ArtifactWriteSession &operator=(ArtifactWriteSession &&) = delete;
  ~ArtifactWriteSession();

  auto write_file(std::string file, std::string bytes) -> void;
  auto set_value_type(std::string value_type) -> void {
    meta_.value_type = std::move(value_type);
  }
  auto set_serializer(std::string serializer) -> void {
    meta_.serializer = std::move(serializer);
  }

  [[nodiscard]] auto commit() -> Result<void>;
  auto abandon() -> void;

  [[nodiscard]] auto is_open() const noexcept -> bool { return open_; }
  [[nodiscard]] auto path() const -> const std::filesystem::path & {
    return dir_;
  }

private:
  friend class ArtifactStore;
  ArtifactWriteSession(std::filesystem::path dir, ArtifactMetadata meta);

  std::filesystem::path dir_;
  ArtifactMetadata meta_;
  std::vector<std::pair<std::string, std::string>> pending_;
  int uncaught_on_entry_;
  bool open_{true};
};

// Durable tier: one directory per artifact under <base>/<namespace>/<name>
// holding a metadata file plus the value in a file named "object".
class ArtifactStore final : public IObjectStore {
public:
  ArtifactStore(std::filesystem::path base_dir,
                std::shared_ptr<const SerializerRegistry> serializers);

  [[nodiscard]] auto put(std::string_view key, const JsonValue &value,
                         std::string_view ns) -> Result<void> override;
  [[nodiscard]] auto get(std::string_view key, std::string_view ns)
      -> Result<JsonValue> override;
  [[nodiscard]] auto remove(std::string_view key, std::string_view ns)
      -> Result<void> override;
  [[nodiscard]] auto strategy() const noexcept -> Strategy override {
    return Strategy::Artifact;
  }

  [[nodiscard]] auto begin_write(std::string_view name, std::string_view ns)
      -> Result<ArtifactWriteSession>;
  [[nodiscard]] auto read_metadata(std::string_view name,
                                   std::string_view ns) const
      -> Result<ArtifactMetadata>;
  [[nodiscard]] auto read_file(std::string_view name, std::string_view ns,
                               std::string_view file) const
      -> Result<std::string>;
  [[nodiscard]] auto list(std::string_view ns) const
      -> std::vector<std::string>;
  [[nodiscard]] auto clear(std::string_view ns) -> Result<void>;

  [[nodiscard]] auto base_dir() const noexcept
      -> const std::filesystem::path & {
    return base_dir_;
  }

private:
  [[nodiscard]] auto artifact_dir(std::string_view name,
                                  std::string_view ns) const
      -> std::filesystem::path;

  std::filesystem::path base_dir_;
  std::shared_ptr<const SerializerRegistry> serializers_;
};

} // namespace flowcore
