#include "MediaService.hpp"

#include <chrono>
#include <thread>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/media/MediaClassifier.hpp"
#include "core/util/Ids.hpp"

namespace mgw {

MediaService::MediaService(MetadataRegistry& registry, ObjectStore& store, ServiceOptions opts)
  : registry_(registry),
    store_(store),
    opts_(opts),
    builder_(opts.chunkSize) {}

MediaDescriptor MediaService::upload(std::string_view bytes,
                                     const std::string& filename,
                                     const std::string& declaredContentType) {
  if (filename.empty()) throw InvalidUpload("No file provided");
  if (bytes.empty()) throw InvalidUpload("Empty file");
  if (opts_.restrictTypes && !is_allowed_extension(filename)) {
    throw InvalidUpload("File type not allowed");
  }

  MediaDescriptor d;
  d.id          = uuid4();
  d.filename    = filename;
  d.contentType = resolve_content_type(declaredContentType, filename);
  d.mediaType   = classify_media(d.contentType, filename);
  d.uploadTime  = now_millis();

  store_.put(d.id, bytes, d.contentType);

  try {
    d.sizeBytes = store_.getSize(d.id);
  } catch (const std::exception& e) {
    spdlog::error("upload {}: stored object cannot be measured: {}", d.id, e.what());
    discardObject(d.id);
    throw StorageFailure("size lookup failed for " + d.id);
  }
  if (d.sizeBytes != static_cast<int64_t>(bytes.size())) {
    spdlog::error("upload {}: store reports {} bytes, received {}", d.id, d.sizeBytes, bytes.size());
    discardObject(d.id);
    throw StorageFailure("stored size mismatch for " + d.id);
  }

  try {
    registry_.insert(d);
  } catch (const std::exception& e) {
    spdlog::error("upload {}: registry write failed: {}", d.id, e.what());
    discardObject(d.id);
    throw StorageFailure("registry write failed for " + d.id);
  }

  spdlog::info("stored {} ({}, {} bytes, {}) as {}",
               d.filename, d.contentType, d.sizeBytes, to_string(d.mediaType), d.id);
  return d;
}

void MediaService::discardObject(const std::string& id) {
  try {
    store_.remove(id);
  } catch (const std::exception& e) {
    spdlog::warn("orphaned object {}: cleanup failed: {}", id, e.what());
  }
}

bool MediaService::isTombstoned(const std::string& id) const {
  std::lock_guard lock(tombMu_);
  return tombstones_.count(id) != 0;
}

std::optional<MediaDescriptor> MediaService::find(const std::string& id) const {
  if (isTombstoned(id)) return std::nullopt;
  return registry_.find(id);
}

MediaDescriptor MediaService::info(const std::string& id) const {
  auto d = find(id);
  if (!d) throw NotFoundError(id);
  return *d;
}

std::vector<MediaDescriptor> MediaService::list() const {
  auto all = registry_.list();
  std::lock_guard lock(tombMu_);
  if (tombstones_.empty()) return all;
  std::vector<MediaDescriptor> out;
  out.reserve(all.size());
  for (auto& d : all) {
    if (!tombstones_.count(d.id)) out.push_back(std::move(d));
  }
  return out;
}

bool MediaService::unregister(const std::string& id) {
  for (int attempt = 1; attempt <= opts_.registryAttempts; ++attempt) {
    try {
      registry_.remove(id);
      return true;
    } catch (const std::exception& e) {
      spdlog::warn("delete {}: registry removal attempt {}/{} failed: {}",
                   id, attempt, opts_.registryAttempts, e.what());
    }
    if (attempt < opts_.registryAttempts) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20 * attempt));
    }
  }
  return false;
}

void MediaService::remove(const std::string& id) {
  bool resume = false;
  {
    std::lock_guard lock(tombMu_);
    // a delete already running for this id will report the outcome
    if (!deleting_.insert(id).second) throw NotFoundError(id);
    resume = tombstones_.count(id) != 0;
  }
  struct Release {
    MediaService& svc;
    const std::string& id;
    ~Release() {
      std::lock_guard lock(svc.tombMu_);
      svc.deleting_.erase(id);
    }
  } release{*this, id};

  // A tombstoned id already lost its object; only the registry row is left.
  if (!resume) {
    if (!registry_.find(id)) throw NotFoundError(id);

    // hidden before the object goes, so readers see 404 rather than a dangling row
    {
      std::lock_guard lock(tombMu_);
      tombstones_.insert(id);
    }
    try {
      if (!store_.remove(id)) {
        spdlog::warn("orphaned descriptor {}: object was already missing", id);
      }
    } catch (const std::exception& e) {
      {
        std::lock_guard lock(tombMu_);
        tombstones_.erase(id);
      }
      throw StorageFailure("object removal failed for " + id + ": " + e.what());
    }
  }

  if (!unregister(id)) {
    throw StorageFailure("registry removal failed for " + id);
  }
  {
    std::lock_guard lock(tombMu_);
    tombstones_.erase(id);
  }
  spdlog::info("deleted {}", id);
}

StreamPlan MediaService::planStream(const std::string& id,
                                    std::optional<std::string_view> rangeHeader) const {
  const auto d = find(id);
  return builder_.plan(d ? &*d : nullptr, rangeHeader);
}

std::unique_ptr<BodyPump> MediaService::openBody(const StreamPlan& plan) const {
  try {
    return builder_.open(store_, plan);
  } catch (const NotFoundError&) {
    if (!find(plan.mediaId)) throw;  // deleted since the plan was made
    spdlog::warn("orphaned descriptor {}: object missing from store", plan.mediaId);
    throw StorageFailure("object missing for " + plan.mediaId);
  }
}

} // namespace mgw
