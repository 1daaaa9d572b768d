#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/metadata/MediaDescriptor.hpp"
#include "core/storage/ObjectStore.hpp"
#include "RangeParser.hpp"
#include "ResponsePolicy.hpp"

namespace mgw {

enum class StreamOutcome {
  NotFound,            // 404
  FullBody,            // 200
  PartialBody,         // 206
  RangeNotSatisfiable, // 416
};

// Everything needed to answer GET /stream/{id} before any byte is read.
struct StreamPlan {
  StreamOutcome outcome = StreamOutcome::NotFound;
  int           status = 404;
  HeaderList    headers;
  std::string   mediaId;
  std::string   contentType;
  int64_t       total = 0;   // descriptor sizeBytes
  int64_t       offset = 0;  // first body byte within the object
  int64_t       length = 0;  // body bytes; equals Content-Length

  bool hasBody() const {
    return outcome == StreamOutcome::FullBody || outcome == StreamOutcome::PartialBody;
  }

  // First value for name (case-insensitive), "" if absent.
  std::string header(std::string_view name) const;
};

// Receives body chunks. Returning false means the client is gone.
class ChunkSink {
public:
  virtual ~ChunkSink() = default;
  virtual bool write(const char* data, std::size_t len) = 0;
};

enum class PumpStatus {
  Continue,   // more chunks to emit
  Done,       // exactly plan.length bytes emitted
  ClientGone, // sink refused a chunk
  ReadFailed, // store error or short object; body is truncated
};

/**
 * Copies one planned byte interval from a read handle to a ChunkSink, one
 * bounded chunk at a time. Holds the handle until release() or destruction,
 * and never requests bytes past the end of the interval.
 */
class BodyPump {
public:
  BodyPump(std::unique_ptr<ObjectReader> reader,
           std::string mediaId,
           int64_t offset,
           int64_t length,
           std::size_t chunkSize);

  // Emits the next chunk.
  PumpStatus emitChunk(ChunkSink& sink);

  // Emits chunks until the interval is done or the pump stops.
  PumpStatus run(ChunkSink& sink);

  // Drops the read handle; any further emitChunk() fails.
  void release();

  int64_t emitted() const { return emitted_; }
  int64_t length() const { return length_; }
  bool holdsReader() const { return reader_ != nullptr; }

private:
  std::unique_ptr<ObjectReader> reader_;
  std::string mediaId_;
  int64_t offset_;
  int64_t length_;
  int64_t emitted_ = 0;
  std::vector<char> buf_;
};

class StreamResponseBuilder {
public:
  explicit StreamResponseBuilder(std::size_t chunkSize);

  // Decides status and headers. descriptor == nullptr means unknown id.
  StreamPlan plan(const MediaDescriptor* descriptor,
                  std::optional<std::string_view> rangeHeader) const;

  // Opens the body for a FullBody/PartialBody plan. The handle is acquired
  // here, before headers go out, so a later delete cannot alter the bytes.
  // Throws NotFoundError if the object is gone, StorageFailure if it cannot
  // be opened or its length disagrees with the plan.
  std::unique_ptr<BodyPump> open(const ObjectStore& store, const StreamPlan& plan) const;

  std::size_t chunkSize() const { return chunkSize_; }

private:
  std::size_t chunkSize_;
};

} // namespace mgw
