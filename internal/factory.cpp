#include "factory.hpp"

#include "internal/config/runtime_options.hpp"
#include "internal/credentials/credential_store.hpp"
#include "internal/credentials/secret_cipher.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/grpc/fleet_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/fleet_runtime.hpp"
#include "internal/service/fleet_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/transport/mosquitto_client.hpp"

namespace fleetlink::factory {

using fleetlink::observability::StringField;

Application Build(const fleetlink::runtime::config::RuntimeConfig& config) {
  Application app;

  auto options = fleetlink::config::ResolveOptions(config);

  // ------------------------------------------------------------------
  // Credential store
  // ------------------------------------------------------------------
  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(options.credential_store_path);
  sqlite_db->Configure();

  auto cipher      = std::make_shared<credentials::SecretCipher>(credentials::SecretCipher::LoadOrCreateKey(options.credential_key_file));
  auto credentials = std::make_shared<credentials::CredentialStore>(sqlite_db, cipher);

  if (!credentials->HasStoredConfig()) {
    FLEETLINK_LOG_WARN("No stored broker configuration, using defaults and process overrides",
                       {StringField("store", options.credential_store_path)});
  }

  // ------------------------------------------------------------------
  // Fleet runtime
  // ------------------------------------------------------------------
  auto client  = std::make_shared<transport::MosquittoClient>();
  app.runtime  = std::make_shared<runtime::FleetRuntime>(std::move(options), credentials, client);
  app.runtime->StartReaper();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.runtime = app.runtime;

  auto fleet_service = std::make_shared<service::FleetService>(ctx);

  app.grpc_services.push_back(std::make_unique<grpc::FleetServer>(fleet_service));

  return app;
}

} // namespace fleetlink::factory
