#include <cassert>
#include <iostream>
#include <optional>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using imgvar::db::ErrorCode;
using imgvar::db::memory::MemoryRepository;
using imgvar::db::model::ImageRecord;
using namespace imgvar::v1;

ImageRecord Original(int32_t width, int32_t height) {
  ImageRecord r;
  r.storage_kind = STORAGE_KIND_FILE_BACKED;
  r.locator      = std::to_string(width) + "_" + std::to_string(height) + "-0-upload.png";
  r.width        = width;
  r.height       = height;
  r.format       = IMAGE_FORMAT_PNG;
  return r;
}

ImageRecord Variant(int64_t parent_id, int32_t width, int32_t height, std::optional<std::pair<int32_t, int32_t>> wanted) {
  auto r      = Original(width, height);
  r.parent_id = parent_id;
  if (wanted) {
    r.wanted_width  = wanted->first;
    r.wanted_height = wanted->second;
  }
  return r;
}

int64_t Insert(MemoryRepository& repo, ImageRecord r) {
  auto tx = repo.Begin();
  assert(repo.InsertImage(*tx, r));
  tx->Commit();
  return r.id;
}

void TestInsertAssignsIdsAndTimestamps() {
  MemoryRepository repo;

  auto tx = repo.Begin();
  auto a  = Original(800, 600);
  auto b  = Original(640, 480);
  assert(repo.InsertImage(*tx, a));
  assert(repo.InsertImage(*tx, b));
  assert(a.id > 0);
  assert(b.id > a.id);
  assert(a.created_at_ms > 0);

  // Own writes are visible before commit.
  assert(repo.GetImage(*tx, a.id).has_value());
  tx->Commit();

  auto read_tx = repo.Begin();
  auto read    = repo.GetImage(*read_tx, b.id);
  assert(read.has_value());
  assert(*read == b);
  assert(!repo.GetImage(*read_tx, 9999).has_value());
}

void TestRollbackDiscardsInserts() {
  MemoryRepository repo;

  int64_t rolled_back = 0;
  int64_t abandoned   = 0;
  {
    auto tx = repo.Begin();
    auto r  = Original(10, 10);
    assert(repo.InsertImage(*tx, r));
    rolled_back = r.id;
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    auto r  = Original(10, 10);
    assert(repo.InsertImage(*tx, r));
    abandoned = r.id;
  }

  // Ids are never reused.
  assert(abandoned > rolled_back);

  auto tx = repo.Begin();
  assert(!repo.GetImage(*tx, rolled_back).has_value());
  assert(!repo.GetImage(*tx, abandoned).has_value());
}

void TestInsertRejectsInvalidRows() {
  MemoryRepository repo;
  auto             tx = repo.Begin();

  auto zero = Original(0, 10);
  auto res  = repo.InsertImage(*tx, zero);
  assert(!res && res.code == ErrorCode::ConstraintViolation);

  auto half_wanted         = Original(10, 10);
  half_wanted.wanted_width = 5;
  assert(!repo.InsertImage(*tx, half_wanted));

  auto bad_format   = Original(10, 10);
  bad_format.format = IMAGE_FORMAT_UNSPECIFIED;
  assert(!repo.InsertImage(*tx, bad_format));

  auto orphan = Variant(4242, 10, 10, std::make_pair(10, 10));
  res         = repo.InsertImage(*tx, orphan);
  assert(!res && res.code == ErrorCode::ConstraintViolation);
}

void TestFindChildMatchesEitherAxis() {
  MemoryRepository repo;
  const auto       parent = Insert(repo, Original(800, 600));

  const auto small = Insert(repo, Variant(parent, 100, 75, std::make_pair(100, 80)));

  auto tx = repo.Begin();

  // exact wanted key
  auto hit = repo.FindChild(*tx, parent, 100, 80);
  assert(hit.has_value() && hit->id == small);

  // wanted_width alone is enough
  hit = repo.FindChild(*tx, parent, 100, 999);
  assert(hit.has_value() && hit->id == small);

  // wanted_height alone is enough
  hit = repo.FindChild(*tx, parent, 7, 80);
  assert(hit.has_value() && hit->id == small);

  // actual size does not match when wanted is set
  assert(!repo.FindChild(*tx, parent, 1, 75).has_value());

  // other parents never match
  assert(!repo.FindChild(*tx, parent + 100, 100, 80).has_value());
}

void TestFindChildWithoutWantedUsesActualSize() {
  MemoryRepository repo;
  const auto       parent = Insert(repo, Original(800, 600));
  const auto       child  = Insert(repo, Variant(parent, 320, 240, std::nullopt));

  auto tx  = repo.Begin();
  auto hit = repo.FindChild(*tx, parent, 320, 1);
  assert(hit.has_value() && hit->id == child);
  hit = repo.FindChild(*tx, parent, 1, 240);
  assert(hit.has_value() && hit->id == child);
  assert(!repo.FindChild(*tx, parent, 321, 241).has_value());
}

void TestFindChildPrefersLargest() {
  MemoryRepository repo;
  const auto       parent = Insert(repo, Original(800, 600));

  Insert(repo, Variant(parent, 200, 150, std::make_pair(200, 480)));
  const auto wide = Insert(repo, Variant(parent, 640, 480, std::make_pair(640, 480)));
  Insert(repo, Variant(parent, 640, 300, std::make_pair(640, 300)));

  auto tx  = repo.Begin();
  auto hit = repo.FindChild(*tx, parent, 640, 480);
  assert(hit.has_value());
  assert(hit->id == wide);
}

void TestListChildrenAndDelete() {
  MemoryRepository repo;
  const auto       parent = Insert(repo, Original(800, 600));
  const auto       a      = Insert(repo, Variant(parent, 100, 75, std::make_pair(100, 100)));
  const auto       b      = Insert(repo, Variant(parent, 50, 37, std::make_pair(50, 50)));

  {
    auto tx       = repo.Begin();
    auto children = repo.ListChildren(*tx, parent);
    assert(children.size() == 2);
    assert(children[0].id == a);
    assert(children[1].id == b);

    auto res = repo.DeleteImage(*tx, parent);
    assert(!res && res.code == ErrorCode::Conflict);

    res = repo.DeleteImage(*tx, 9999);
    assert(!res && res.code == ErrorCode::NotFound);

    assert(repo.DeleteImage(*tx, a));
    assert(repo.DeleteImage(*tx, b));
    assert(repo.DeleteImage(*tx, parent));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(!repo.GetImage(*tx, parent).has_value());
  assert(repo.ListChildren(*tx, parent).empty());
}

void TestConcurrentChildBlocksDeleteAtCommit() {
  MemoryRepository repo;
  const auto       parent = Insert(repo, Original(800, 600));

  auto deleter = repo.Begin();
  assert(repo.DeleteImage(*deleter, parent));

  Insert(repo, Variant(parent, 100, 75, std::make_pair(100, 100)));

  bool threw = false;
  try {
    deleter->Commit();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto tx = repo.Begin();
  assert(repo.GetImage(*tx, parent).has_value());
}

void TestSnapshotIsolation() {
  MemoryRepository repo;

  auto reader = repo.Begin();
  const auto id = Insert(repo, Original(30, 30));

  assert(!repo.GetImage(*reader, id).has_value());

  auto fresh = repo.Begin();
  assert(repo.GetImage(*fresh, id).has_value());
}

} // namespace

int main() {
  TestInsertAssignsIdsAndTimestamps();
  TestRollbackDiscardsInserts();
  TestInsertRejectsInvalidRows();
  TestFindChildMatchesEitherAxis();
  TestFindChildWithoutWantedUsesActualSize();
  TestFindChildPrefersLargest();
  TestListChildrenAndDelete();
  TestConcurrentChildBlocksDeleteAtCommit();
  TestSnapshotIsolation();

  std::cout << "imgvar_unit_memory_repository: pass\n";
  return 0;
}
