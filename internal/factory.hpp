#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/codec/image_codec.hpp"
#include "internal/core/placement_policy.hpp"
#include "internal/core/variant_resolver.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/storage/blob_store.hpp"

namespace imgvar::factory {

/*
  Application

  Owns all long-lived objects. Everything here lives for the lifetime
  of the process; the resolver borrows the rest through shared_ptr.
*/
struct Application {
  std::shared_ptr<db::ImageRepository>   repository;
  codec::ImageCodecPtr                   codec;
  storage::BlobStorePtr                  blobs;
  std::shared_ptr<core::PlacementPolicy> placement;
  std::shared_ptr<core::VariantResolver> resolver;
};

/*
  Build

  Composition root. The ONLY place allowed to know concrete backend
  types. Runs pending schema migrations before returning.
*/
Application Build(const imgvar::runtime::config::RuntimeConfig& config);

// Exposed for tests that want a repository without the rest.
std::shared_ptr<db::ImageRepository> BuildRepository(const imgvar::runtime::config::RuntimeConfig& config);

} // namespace imgvar::factory
