#include "flowcore/store/artifact.hpp"

#include "flowcore/util/id.hpp"
#include "flowcore/util/log.hpp"
#include "flowcore/util/time.hpp"

#include <glaze/json.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <iterator>
#include <system_error>

namespace glz {
template <> struct meta<flowcore::ArtifactMetadata> {
  using T = flowcore::ArtifactMetadata;
  static constexpr auto value =
      object("name", &T::name, "namespace", &T::ns, "value_type",
             &T::value_type, "serializer", &T::serializer, "committed",
             &T::committed, "files", &T::files, "created_at", &T::created_at,
             "updated_at", &T::updated_at);
};
} // namespace glz

namespace flowcore {
namespace {

namespace fs = std::filesystem;

auto now_iso() -> std::string {
  return util::format_iso8601(std::chrono::system_clock::now());
}

// write tmp -> rename, so a reader never sees a torn file
auto write_atomic(const fs::path &target, std::string_view bytes)
    -> Result<void> {
  auto tmp = target;
  tmp += ".tmp-" + detail::generate_short_uuid();
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return fail(Error::StorageUnavailable);
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      return fail(Error::StorageUnavailable);
    }
  }
  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    fs::remove(tmp, ec);
    return fail(Error::StorageUnavailable);
  }
  return ok();
}

auto read_whole(const fs::path &path) -> Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(Error::NotFound);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

auto write_metadata(const fs::path &dir, const ArtifactMetadata &meta)
    -> Result<void> {
  auto text = glz::write_json(meta);
  if (!text) {
    return fail(Error::SerializationFailed);
  }
  return write_atomic(dir / kArtifactMetadataFile, *text);
}

} // namespace

auto is_valid_artifact_name(std::string_view name) -> bool {
  return !name.empty() && std::ranges::all_of(name, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' ||
           c == '-';
  });
}

ArtifactWriteSession::ArtifactWriteSession(fs::path dir, ArtifactMetadata meta)
    : dir_(std::move(dir)), meta_(std::move(meta)),
      uncaught_on_entry_(std::uncaught_exceptions()) {}

ArtifactWriteSession::ArtifactWriteSession(
    ArtifactWriteSession &&other) noexcept
    : dir_(std::move(other.dir_)), meta_(std::move(other.meta_)),
      pending_(std::move(other.pending_)),
      uncaught_on_entry_(other.uncaught_on_entry_), open_(other.open_) {
  other.open_ = false;
}

ArtifactWriteSession::~ArtifactWriteSession() {
  if (!open_) {
    return;
  }
  if (std::uncaught_exceptions() > uncaught_on_entry_) {
    abandon();
    return;
  }
  if (auto r = commit(); !r) {
    log::error("Artifact '{}/{}' failed to commit on scope exit: {}", meta_.ns,
               meta_.name, r.error().message());
  }
}

auto ArtifactWriteSession::write_file(std::string file, std::string bytes)
    -> void {
  pending_.emplace_back(std::move(file), std::move(bytes));
}

auto ArtifactWriteSession::commit() -> Result<void> {
  if (!open_) {
    return fail(Error::InvalidState);
  }
  open_ = false;

  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    log::error("Cannot create artifact directory {}: {}", dir_.string(),
               ec.message());
    return fail(Error::StorageUnavailable);
  }

  meta_.committed = false;
  meta_.updated_at = now_iso();
  if (auto r = write_metadata(dir_, meta_); !r) {
    return r;
  }

  for (auto &[file, bytes] : pending_) {
    if (auto r = write_atomic(dir_ / file, bytes); !r) {
      log::warn("Artifact '{}/{}' left uncommitted: writing '{}' failed",
                meta_.ns, meta_.name, file);
      return r;
    }
    if (!std::ranges::contains(meta_.files, file)) {
      meta_.files.push_back(file);
    }
  }
  pending_.clear();

  meta_.committed = true;
  meta_.updated_at = now_iso();
  return write_metadata(dir_, meta_);
}

auto ArtifactWriteSession::abandon() -> void {
  if (!open_) {
    return;
  }
  open_ = false;
  pending_.clear();
  // Record the abandoned state only where an artifact already exists; a
  // fresh one simply never appears.
  std::error_code ec;
  if (fs::exists(dir_ / kArtifactMetadataFile, ec)) {
    meta_.committed = false;
    meta_.updated_at = now_iso();
    if (auto r = write_metadata(dir_, meta_); !r) {
      log::error("Artifact '{}/{}' could not be flagged abandoned: {}",
                 meta_.ns, meta_.name, r.error().message());
    }
  }
  log::debug("Artifact '{}/{}' write abandoned", meta_.ns, meta_.name);
}

ArtifactStore::ArtifactStore(
    fs::path base_dir, std::shared_ptr<const SerializerRegistry> serializers)
    : base_dir_(std::move(base_dir)), serializers_(std::move(serializers)) {}

auto ArtifactStore::artifact_dir(std::string_view name,
                                 std::string_view ns) const -> fs::path {
  return base_dir_ / std::string(ns) / std::string(name);
}

auto ArtifactStore::begin_write(std::string_view name, std::string_view ns)
    -> Result<ArtifactWriteSession> {
  if (!is_valid_artifact_name(name) || !is_valid_artifact_name(ns)) {
    return fail(Error::InvalidArgument);
  }
  ArtifactMetadata meta;
  if (auto existing = read_metadata(name, ns)) {
    meta = std::move(*existing);
  } else {
    meta.name = std::string(name);
    meta.ns = std::string(ns);
    meta.created_at = now_iso();
  }
  return ArtifactWriteSession(artifact_dir(name, ns), std::move(meta));
}

auto ArtifactStore::read_metadata(std::string_view name,
                                  std::string_view ns) const
    -> Result<ArtifactMetadata> {
  if (!is_valid_artifact_name(name) || !is_valid_artifact_name(ns)) {
    return fail(Error::InvalidArgument);
  }
  auto text = read_whole(artifact_dir(name, ns) / kArtifactMetadataFile);
  if (!text) {
    return fail(text.error());
  }
  ArtifactMetadata meta;
  if (auto ec = glz::read_json(meta, *text); ec) {
    log::warn("Corrupt artifact metadata for '{}/{}'", ns, name);
    return fail(Error::ParseError);
  }
  return ok(std::move(meta));
}

auto ArtifactStore::read_file(std::string_view name, std::string_view ns,
                              std::string_view file) const
    -> Result<std::string> {
  auto meta = read_metadata(name, ns);
  if (!meta) {
    return fail(meta.error());
  }
  if (!meta->committed) {
    log::debug("Ignoring uncommitted artifact '{}/{}'", ns, name);
    return fail(Error::NotFound);
  }
  return read_whole(artifact_dir(name, ns) / std::string(file));
}

auto ArtifactStore::put(std::string_view key, const JsonValue &value,
                        std::string_view ns) -> Result<void> {
  auto encoded = serializers_->serialize(value);
  if (!encoded) {
    return fail(encoded.error());
  }
  auto session = begin_write(key, ns);
  if (!session) {
    return fail(session.error());
  }
  session->set_value_type("object");
  session->set_serializer(std::move(encoded->serializer));
  session->write_file(std::string(kArtifactObjectFile),
                      std::move(encoded->bytes));
  return session->commit();
}

auto ArtifactStore::get(std::string_view key, std::string_view ns)
    -> Result<JsonValue> {
  auto meta = read_metadata(key, ns);
  if (!meta) {
    return fail(meta.error() == make_error_code(Error::InvalidArgument)
                    ? meta.error()
                    : make_error_code(Error::NotFound));
  }
  if (!meta->committed) {
    return fail(Error::NotFound);
  }
  if (meta->value_type != "object") {
    log::warn("Artifact '{}/{}' has value type '{}', reading as object", ns,
              key, meta->value_type);
  }
  auto bytes = read_whole(artifact_dir(key, ns) / kArtifactObjectFile);
  if (!bytes) {
    return fail(Error::NotFound);
  }
  return serializers_->deserialize(
      meta->serializer.empty() ? "json" : meta->serializer, *bytes);
}

auto ArtifactStore::remove(std::string_view key, std::string_view ns)
    -> Result<void> {
  if (!is_valid_artifact_name(key) || !is_valid_artifact_name(ns)) {
    return fail(Error::InvalidArgument);
  }
  std::error_code ec;
  fs::remove_all(artifact_dir(key, ns), ec);
  if (ec) {
    return fail(Error::StorageUnavailable);
  }
  return ok();
}

auto ArtifactStore::list(std::string_view ns) const
    -> std::vector<std::string> {
  std::vector<std::string> names;
  std::error_code ec;
  auto dir = base_dir_ / std::string(ns);
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_directory(ec) &&
        fs::exists(it->path() / kArtifactMetadataFile, ec)) {
      names.push_back(it->path().filename().string());
    }
  }
  std::ranges::sort(names);
  return names;
}

auto ArtifactStore::clear(std::string_view ns) -> Result<void> {
  if (!is_valid_artifact_name(ns)) {
    return fail(Error::InvalidArgument);
  }
  std::error_code ec;
  fs::remove_all(base_dir_ / std::string(ns), ec);
  if (ec) {
    return fail(Error::StorageUnavailable);
  }
  return ok();
}

} // namespace flowcore
