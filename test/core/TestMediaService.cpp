#include "core/media/MediaService.hpp"
#include "core/storage/MemoryObjectStore.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

using namespace mgw;
using mgw::test::FlakyRegistry;
using mgw::test::StringSink;
using mgw::test::pattern_bytes;

namespace {

// Object store whose writes or removals can be made to fail.
class FlakyStore : public MemoryObjectStore {
public:
  void put(const std::string& id, std::string_view bytes, const std::string& type) override {
    if (failPuts) throw StorageFailure("injected put failure");
    MemoryObjectStore::put(id, bytes, type);
  }
  bool remove(const std::string& id) override {
    if (failRemoves) throw StorageFailure("injected remove failure");
    if (beforeRemove) beforeRemove(id);
    return MemoryObjectStore::remove(id);
  }

  bool failPuts = false;
  bool failRemoves = false;
  std::function<void(const std::string&)> beforeRemove;
};

// Registry that can park the next find() until released.
class GatedRegistry : public InMemoryRegistry {
public:
  std::optional<MediaDescriptor> find(const std::string& id) const override {
    {
      std::unique_lock lock(mu_);
      if (armed_) {
        armed_ = false;
        parked_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return released_; });
      }
    }
    return InMemoryRegistry::find(id);
  }

  void holdNextFind() {
    std::lock_guard lock(mu_);
    armed_ = true;
    released_ = false;
  }

  void waitUntilParked() {
    std::unique_lock lock(mu_);
    cv_.wait(lock, [this] { return parked_; });
  }

  void release() {
    std::lock_guard lock(mu_);
    released_ = true;
    cv_.notify_all();
  }

private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  mutable bool armed_ = false;
  mutable bool parked_ = false;
  bool released_ = false;
};

struct Fixture {
  FlakyRegistry registry;
  FlakyStore store;
  MediaService service{registry, store, ServiceOptions{true, 64, 3}};
};

} // namespace

TEST(MediaServiceTest, UploadRegistersDescriptor) {
  Fixture f;
  const std::string bytes = pattern_bytes(1234);
  const auto d = f.service.upload(bytes, "holiday.MP4", "");

  EXPECT_EQ(d.id.size(), 36u);
  EXPECT_EQ(d.filename, "holiday.MP4");
  EXPECT_EQ(d.contentType, "video/mp4");
  EXPECT_EQ(d.mediaType, MediaType::Video);
  EXPECT_EQ(d.sizeBytes, 1234);
  EXPECT_GT(d.uploadTime, 0);

  EXPECT_EQ(f.store.getSize(d.id), 1234);
  EXPECT_EQ(f.store.contentTypeOf(d.id), "video/mp4");
  auto found = f.service.find(d.id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->sizeBytes, d.sizeBytes);
}

TEST(MediaServiceTest, DeclaredContentTypeDecidesMediaType) {
  Fixture f;
  const auto d = f.service.upload("abc", "song.mp4", "audio/mp4");
  EXPECT_EQ(d.contentType, "audio/mp4");
  EXPECT_EQ(d.mediaType, MediaType::Audio);
}

TEST(MediaServiceTest, UploadRejectsBadInput) {
  Fixture f;
  EXPECT_THROW(f.service.upload("", "a.mp4", ""), InvalidUpload);
  EXPECT_THROW(f.service.upload("x", "", ""), InvalidUpload);
  EXPECT_THROW(f.service.upload("x", "script.sh", "video/mp4"), InvalidUpload);
  EXPECT_EQ(f.store.count(), 0u);
  EXPECT_TRUE(f.service.list().empty());
}

TEST(MediaServiceTest, UnrestrictedUploadClassifiesOther) {
  FlakyRegistry registry;
  MemoryObjectStore store;
  MediaService service(registry, store, ServiceOptions{false, 64, 3});
  const auto d = service.upload("plain text", "notes.txt", "text/plain");
  EXPECT_EQ(d.mediaType, MediaType::Other);
  EXPECT_EQ(d.contentType, "text/plain");
}

TEST(MediaServiceTest, StoreFailureLeavesNothing) {
  Fixture f;
  f.store.failPuts = true;
  EXPECT_THROW(f.service.upload("abc", "a.mp4", ""), StorageFailure);
  EXPECT_TRUE(f.service.list().empty());
}

TEST(MediaServiceTest, RegistryFailureRemovesObject) {
  Fixture f;
  f.registry.failInserts = true;
  EXPECT_THROW(f.service.upload("abc", "a.mp4", ""), StorageFailure);
  EXPECT_EQ(f.store.count(), 0u);
  EXPECT_TRUE(f.service.list().empty());
}

TEST(MediaServiceTest, ListInUploadOrder) {
  Fixture f;
  const auto a = f.service.upload("1", "a.png", "");
  const auto b = f.service.upload("22", "b.gif", "");
  const auto c = f.service.upload("333", "c.wav", "");

  const auto all = f.service.list();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].id, a.id);
  EXPECT_EQ(all[1].id, b.id);
  EXPECT_EQ(all[2].id, c.id);
}

TEST(MediaServiceTest, DeleteRemovesEverywhere) {
  Fixture f;
  const auto d = f.service.upload("abc", "a.mp4", "");
  f.service.remove(d.id);

  EXPECT_FALSE(f.store.exists(d.id));
  EXPECT_FALSE(f.service.find(d.id).has_value());
  EXPECT_THROW(f.service.info(d.id), NotFoundError);
  EXPECT_TRUE(f.service.list().empty());
  EXPECT_EQ(f.service.planStream(d.id, std::nullopt).status, 404);
  EXPECT_THROW(f.service.remove(d.id), NotFoundError);
}

TEST(MediaServiceTest, DeleteUnknownIdIsNotFound) {
  Fixture f;
  EXPECT_THROW(f.service.remove("nope"), NotFoundError);
}

TEST(MediaServiceTest, DeleteStoreFailureKeepsDescriptor) {
  Fixture f;
  const auto d = f.service.upload("abc", "a.mp4", "");
  f.store.failRemoves = true;
  EXPECT_THROW(f.service.remove(d.id), StorageFailure);
  EXPECT_TRUE(f.service.find(d.id).has_value());
  EXPECT_EQ(f.service.list().size(), 1u);
}

TEST(MediaServiceTest, ConcurrentDeleteSucceedsOnce) {
  GatedRegistry registry;
  MemoryObjectStore store;
  MediaService service(registry, store, ServiceOptions{true, 64, 3});
  const auto d = service.upload("abc", "a.mp4", "");

  registry.holdNextFind();
  bool firstDeleted = false;
  std::thread first([&] {
    service.remove(d.id);
    firstDeleted = true;
  });
  registry.waitUntilParked();

  EXPECT_THROW(service.remove(d.id), NotFoundError);

  registry.release();
  first.join();
  EXPECT_TRUE(firstDeleted);
  EXPECT_FALSE(store.exists(d.id));
  EXPECT_FALSE(registry.find(d.id).has_value());
  EXPECT_THROW(service.remove(d.id), NotFoundError);
}

TEST(MediaServiceTest, MediaIsHiddenBeforeObjectRemoval) {
  Fixture f;
  const auto d = f.service.upload("abcdef", "a.mp4", "");
  const auto plan = f.service.planStream(d.id, std::nullopt);

  bool checked = false;
  f.store.beforeRemove = [&](const std::string& id) {
    EXPECT_FALSE(f.service.find(id).has_value());
    EXPECT_EQ(f.service.planStream(id, std::nullopt).status, 404);
    EXPECT_THROW(f.service.remove(id), NotFoundError);
    checked = true;
  };
  f.registry.failRemoves = 3;
  EXPECT_THROW(f.service.remove(d.id), StorageFailure);
  EXPECT_TRUE(checked);

  // object gone, registry row left behind: a stream planned earlier is a 404, not a storage error
  EXPECT_TRUE(f.registry.find(d.id).has_value());
  EXPECT_THROW(f.service.openBody(plan), NotFoundError);
}

TEST(MediaServiceTest, DeleteRetriesRegistryRemoval) {
  Fixture f;
  const auto d = f.service.upload("abc", "a.mp4", "");
  f.registry.failRemoves = 2;
  f.service.remove(d.id);
  EXPECT_EQ(f.registry.removeCalls, 3);
  EXPECT_FALSE(f.registry.find(d.id).has_value());
}

TEST(MediaServiceTest, UnfinishedDeleteHidesMediaUntilRetried) {
  Fixture f;
  const auto keep = f.service.upload("keep", "k.mp4", "");
  const auto d = f.service.upload("abc", "a.mp4", "");
  f.registry.failRemoves = 3;
  EXPECT_THROW(f.service.remove(d.id), StorageFailure);

  // the registry row is still there, but every read treats it as deleted
  EXPECT_TRUE(f.registry.find(d.id).has_value());
  EXPECT_FALSE(f.service.find(d.id).has_value());
  EXPECT_EQ(f.service.planStream(d.id, std::nullopt).status, 404);
  const auto all = f.service.list();
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0].id, keep.id);

  // a repeated delete finishes the job
  f.service.remove(d.id);
  EXPECT_FALSE(f.registry.find(d.id).has_value());
  EXPECT_THROW(f.service.remove(d.id), NotFoundError);
}

TEST(MediaServiceTest, UploadThenStreamSeesSameSizeAndType) {
  Fixture f;
  const std::string bytes = pattern_bytes(10 * 1024 * 1024);
  const auto d = f.service.upload(bytes, "big.webm", "");

  const auto plan = f.service.planStream(d.id, std::nullopt);
  EXPECT_EQ(plan.status, 200);
  EXPECT_EQ(plan.header("Content-Length"), std::to_string(d.sizeBytes));
  EXPECT_EQ(plan.header("Content-Type"), d.contentType);

  auto pump = f.service.openBody(plan);
  StringSink sink;
  EXPECT_EQ(pump->run(sink), PumpStatus::Done);
  EXPECT_TRUE(sink.body == bytes);
}

TEST(MediaServiceTest, OpenBodyAfterDeleteIsNotFound) {
  Fixture f;
  const auto d = f.service.upload("abcdef", "a.mp4", "");
  const auto plan = f.service.planStream(d.id, std::string_view("bytes=1-2"));
  f.service.remove(d.id);
  EXPECT_THROW(f.service.openBody(plan), NotFoundError);
}

TEST(MediaServiceTest, DescriptorWithoutObjectIsStorageFailure) {
  Fixture f;
  const auto d = f.service.upload("abcdef", "a.mp4", "");
  f.store.MemoryObjectStore::remove(d.id);
  const auto plan = f.service.planStream(d.id, std::nullopt);
  EXPECT_EQ(plan.status, 200);
  EXPECT_THROW(f.service.openBody(plan), StorageFailure);
}

TEST(MediaServiceTest, StreamSurvivesConcurrentDelete) {
  Fixture f;
  const std::string bytes = pattern_bytes(4000);
  const auto d = f.service.upload(bytes, "a.mp3", "");

  const auto plan = f.service.planStream(d.id, std::string_view("bytes=500-3499"));
  auto pump = f.service.openBody(plan);

  StringSink sink;
  bool deleted = false;
  sink.afterChunk = [&] {
    if (!deleted) {
      f.service.remove(d.id);
      deleted = true;
    }
  };
  EXPECT_EQ(pump->run(sink), PumpStatus::Done);
  EXPECT_TRUE(deleted);
  EXPECT_EQ(std::to_string(sink.body.size()), plan.header("Content-Length"));
  EXPECT_EQ(sink.body, bytes.substr(500, 3000));
  EXPECT_FALSE(f.service.find(d.id).has_value());
}
