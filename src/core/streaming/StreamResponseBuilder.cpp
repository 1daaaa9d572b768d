#include "StreamResponseBuilder.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace mgw {

namespace {

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

} // namespace

std::string StreamPlan::header(std::string_view name) const {
  for (const auto& [k, v] : headers) {
    if (iequals(k, name)) return v;
  }
  return {};
}

// ---- BodyPump ----

BodyPump::BodyPump(std::unique_ptr<ObjectReader> reader,
                   std::string mediaId,
                   int64_t offset,
                   int64_t length,
                   std::size_t chunkSize)
  : reader_(std::move(reader)),
    mediaId_(std::move(mediaId)),
    offset_(offset),
    length_(length),
    buf_(std::max<std::size_t>(chunkSize, 1)) {}

PumpStatus BodyPump::emitChunk(ChunkSink& sink) {
  if (emitted_ >= length_) {
    release();
    return PumpStatus::Done;
  }
  if (!reader_) return PumpStatus::ReadFailed;

  const auto want = static_cast<std::size_t>(
    std::min<int64_t>(static_cast<int64_t>(buf_.size()), length_ - emitted_));

  std::size_t got = 0;
  try {
    while (got < want) {
      const std::size_t n = reader_->readAt(offset_ + emitted_ + static_cast<int64_t>(got),
                                            buf_.data() + got, want - got);
      if (n == 0) break;
      got += n;
    }
  } catch (const std::exception& e) {
    spdlog::error("stream {}: read failed at byte {}: {}", mediaId_, offset_ + emitted_, e.what());
    release();
    return PumpStatus::ReadFailed;
  }

  if (got < want) {
    // never pad: a short object would contradict Content-Length
    spdlog::error("stream {}: object ended early at byte {}", mediaId_,
                  offset_ + emitted_ + static_cast<int64_t>(got));
    release();
    return PumpStatus::ReadFailed;
  }

  if (!sink.write(buf_.data(), got)) {
    spdlog::debug("stream {}: client went away after {} of {} bytes", mediaId_, emitted_, length_);
    release();
    return PumpStatus::ClientGone;
  }
  emitted_ += static_cast<int64_t>(got);

  if (emitted_ >= length_) {
    release();
    return PumpStatus::Done;
  }
  return PumpStatus::Continue;
}

PumpStatus BodyPump::run(ChunkSink& sink) {
  PumpStatus st;
  while ((st = emitChunk(sink)) == PumpStatus::Continue) {}
  return st;
}

void BodyPump::release() {
  reader_.reset();
}

// ---- StreamResponseBuilder ----

StreamResponseBuilder::StreamResponseBuilder(std::size_t chunkSize) : chunkSize_(chunkSize) {
  if (chunkSize_ == 0) throw std::invalid_argument("chunk size must be positive");
}

StreamPlan StreamResponseBuilder::plan(const MediaDescriptor* descriptor,
                                       std::optional<std::string_view> rangeHeader) const {
  StreamPlan p;
  if (!descriptor) return p;

  const int64_t T = descriptor->sizeBytes;
  p.mediaId = descriptor->id;
  p.contentType = descriptor->contentType;
  p.total = T;

  const RangeResult r = parse_range(rangeHeader, T);
  switch (r.kind) {
    case RangeResult::Kind::Unsatisfiable:
      p.outcome = StreamOutcome::RangeNotSatisfiable;
      p.status = 416;
      p.headers.emplace_back("Content-Range", unsatisfied_content_range(T));
      return p;

    case RangeResult::Kind::Satisfiable:
      p.outcome = StreamOutcome::PartialBody;
      p.status = 206;
      p.offset = r.start;
      p.length = r.length();
      p.headers = inline_media_headers(descriptor->contentType);
      p.headers.emplace_back("Content-Range", content_range(r.start, r.end, T));
      break;

    case RangeResult::Kind::NoRange:
      p.outcome = StreamOutcome::FullBody;
      p.status = 200;
      p.offset = 0;
      p.length = T;
      p.headers = inline_media_headers(descriptor->contentType);
      break;
  }
  p.headers.emplace_back("Content-Length", std::to_string(p.length));
  return p;
}

std::unique_ptr<BodyPump> StreamResponseBuilder::open(const ObjectStore& store,
                                                      const StreamPlan& plan) const {
  if (!plan.hasBody()) throw std::logic_error("open() on a plan without body");

  auto reader = store.openReader(plan.mediaId);
  if (reader->size() != plan.total) {
    throw StorageFailure("object " + plan.mediaId + " has " + std::to_string(reader->size()) +
                         " bytes, registry says " + std::to_string(plan.total));
  }
  return std::make_unique<BodyPump>(std::move(reader), plan.mediaId, plan.offset,
                                    plan.length, chunkSize_);
}

} // namespace mgw
