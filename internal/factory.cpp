#include "factory.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/crypto/identity.hpp"
#include "internal/crypto/key_directory.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"

namespace courier::factory {

using courier::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultPassphraseEnv = "COURIER_IDENTITY_PASSPHRASE";

constexpr std::chrono::milliseconds kDefaultReaperInterval{std::chrono::seconds(60)};

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    if (database.sqlite().path().empty()) {
      throw util::InvalidArgument("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->VerifyIntegrity();
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  COURIER_LOG_WARN("no database configured, bundles are kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::string Passphrase(const RuntimeConfig& config) {
  const auto  env_name = config.node().passphrase_env().empty() ? std::string(kDefaultPassphraseEnv) : config.node().passphrase_env();
  const char* value    = std::getenv(env_name.c_str());
  if (!value || std::string(value).empty()) {
    throw util::InvalidArgument("passphrase environment variable " + env_name + " is not set");
  }
  return value;
}

std::shared_ptr<crypto::NodeIdentity> BuildIdentity(const RuntimeConfig& config) {
  if (config.node().identity_path().empty()) {
    COURIER_LOG_WARN("no identity_path configured, using an ephemeral identity");
    return crypto::NodeIdentity::Generate();
  }
  return crypto::NodeIdentity::LoadOrCreate(config.node().identity_path(), Passphrase(config));
}

std::shared_ptr<crypto::GroupKey> BuildGroupKey(const RuntimeConfig& config) {
  if (config.node().trusted_group_key_path().empty()) {
    return nullptr;
  }
  return crypto::GroupKey::Load(config.node().trusted_group_key_path(), Passphrase(config));
}

std::shared_ptr<crypto::KeyDirectory> BuildKeyDirectory(const RuntimeConfig& config) {
  auto keys = std::make_shared<crypto::KeyDirectory>();
  for (const auto& peer : config.node().known_peers()) {
    const auto box_key = util::FromHex(peer.box_key());
    if (peer.node_id().size() != model::kSigningKeySize * 2 || !box_key || box_key->size() != model::kBoxKeySize) {
      throw util::InvalidArgument("invalid known peer entry: " + peer.node_id());
    }
    model::BoxPublicKey key{};
    std::copy(box_key->begin(), box_key->end(), key.begin());
    keys->Learn(peer.node_id(), key);
  }
  return keys;
}

} // namespace

store::StoreOptions StoreOptionsFrom(const RuntimeConfig& config) {
  store::StoreOptions options;
  if (config.store().capacity_bytes() > 0) {
    options.capacity_bytes = config.store().capacity_bytes();
  }
  options.hard_capacity_bytes = config.store().hard_capacity_bytes();
  options.retry_base          = util::DurationOr(config.propagation().retry_base(), options.retry_base);
  options.retry_max           = util::DurationOr(config.propagation().retry_max(), options.retry_max);
  return options;
}

core::NodeOptions NodeOptionsFrom(const RuntimeConfig& config) {
  core::NodeOptions options;
  options.subscriptions.assign(config.node().subscriptions().begin(), config.node().subscriptions().end());
  options.trusted_peers.assign(config.node().trusted_peers().begin(), config.node().trusted_peers().end());
  options.default_ttl = util::DurationOr(config.node().default_ttl(), options.default_ttl);
  if (config.node().default_hop_limit() > 0) {
    if (config.node().default_hop_limit() > std::numeric_limits<uint16_t>::max()) {
      throw util::InvalidArgument("node.default_hop_limit out of range");
    }
    options.default_hop_limit = static_cast<uint16_t>(config.node().default_hop_limit());
  }
  if (config.store().max_payload_bytes() > 0) {
    options.max_payload_bytes = config.store().max_payload_bytes();
  }
  options.relay_all = !config.node().relay_only_subscribed();

  const auto& propagation           = config.propagation();
  options.session.exchange_timeout  = util::DurationOr(propagation.exchange_timeout(), options.session.exchange_timeout);
  options.session.exchange_interval = util::DurationOr(propagation.exchange_interval(), options.session.exchange_interval);
  if (propagation.max_frame_bytes() > 0) {
    options.session.max_frame_bytes = propagation.max_frame_bytes();
  }
  options.shutdown_grace = util::DurationOr(propagation.shutdown_grace(), options.shutdown_grace);
  return options;
}

/*
    Build full node dependency graph
*/
Runtime Build(const RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config);
  runtime.counters   = std::make_shared<observability::BundleCounters>();
  runtime.store      = std::make_shared<store::BundleStore>(runtime.repository, StoreOptionsFrom(config), runtime.counters);

  const auto reaper_interval = util::DurationOr(config.reaper().interval(), kDefaultReaperInterval);
  runtime.reaper             = std::make_shared<reaper::ExpiryReaper>(runtime.store, reaper_interval, !config.reaper().skip_revalidation());

  // ------------------------------------------------------------------
  // Keys
  // ------------------------------------------------------------------
  auto identity  = BuildIdentity(config);
  auto group_key = BuildGroupKey(config);
  auto keys      = BuildKeyDirectory(config);

  // ------------------------------------------------------------------
  // Node and services
  // ------------------------------------------------------------------
  runtime.node = std::make_shared<core::CourierNode>(std::move(identity), std::move(group_key), std::move(keys), runtime.store, runtime.reaper,
                                                     runtime.counters, NodeOptionsFrom(config));

  service::ServiceContext ctx;
  ctx.node              = runtime.node;
  runtime.admin_service = std::make_shared<service::AdminService>(ctx);

  COURIER_LOG_INFO("node built", {observability::IdField("node_id", runtime.node->NodeId()),
                                  observability::BoolField("sqlite", config.database().has_sqlite())});
  return runtime;
}

} // namespace courier::factory
