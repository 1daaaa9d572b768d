#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "core/metadata/MetadataRegistry.hpp"
#include "core/storage/ObjectStore.hpp"
#include "core/streaming/StreamResponseBuilder.hpp"

namespace mgw {

struct ServiceOptions {
  bool        restrictTypes = true;
  std::size_t chunkSize = 256 * 1024;
  int         registryAttempts = 3;
};

/**
 * Upload, lookup, listing and deletion of media, plus the entry points the
 * stream endpoint uses. Objects are written before they are registered and
 * removed before they are unregistered, so the registry never points at a
 * blob that was never stored.
 */
class MediaService {
public:
  MediaService(MetadataRegistry& registry, ObjectStore& store, ServiceOptions opts = {});

  // Throws InvalidUpload for client errors, StorageFailure if either write fails.
  MediaDescriptor upload(std::string_view bytes,
                         const std::string& filename,
                         const std::string& declaredContentType);

  std::optional<MediaDescriptor> find(const std::string& id) const;

  // Throws NotFoundError.
  MediaDescriptor info(const std::string& id) const;

  std::vector<MediaDescriptor> list() const;

  // Throws NotFoundError, also when another remove() of the same id is still
  // running, or StorageFailure if the removal did not complete.
  void remove(const std::string& id);

  StreamPlan planStream(const std::string& id, std::optional<std::string_view> rangeHeader) const;

  // Throws NotFoundError if the media vanished since planning,
  // StorageFailure if the object cannot be served.
  std::unique_ptr<BodyPump> openBody(const StreamPlan& plan) const;

  const ServiceOptions& options() const { return opts_; }

private:
  bool isTombstoned(const std::string& id) const;
  void discardObject(const std::string& id);
  bool unregister(const std::string& id);

  MetadataRegistry& registry_;
  ObjectStore& store_;
  ServiceOptions opts_;
  StreamResponseBuilder builder_;

  mutable std::mutex tombMu_;
  // ids hidden from readers: object removed or being removed, registry row not yet gone
  std::set<std::string> tombstones_;
  // ids with a remove() in progress
  std::set<std::string> deleting_;
};

} // namespace mgw
