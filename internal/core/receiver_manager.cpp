#include "receiver_manager.hpp"

#include <stdexcept>

#include "internal/auth/policy.hpp"
#include "internal/core/list_query.hpp"
#include "internal/core/receiver_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace receiver::core {

using receiver::observability::StringField;

namespace {

std::string InvalidValue(const std::string& value, const std::string& field) {
  return "Invalid value '" + value + "' specified for '" + field + "'";
}

bool IsVisible(const db::model::ReceiverRecord& record, const auth::RequestContext& requester) {
  return record.project == requester.project || requester.IsAdmin();
}

std::unique_ptr<db::Transaction> BeginOrThrow(db::Repository& repository, const std::string& context) {
  try {
    return repository.Begin();
  } catch (const db::CommitError& e) {
    ThrowIfDbError(e.result(), context);
    throw;
  }
}

void CommitOrThrow(db::Transaction& tx, const std::string& context) {
  try {
    tx.Commit();
  } catch (const db::CommitError& e) {
    ThrowIfDbError(e.result(), context);
    throw;
  }
}

} // namespace

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  if (result.IsTransient()) {
    throw util::Unavailable(message);
  }
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

ReceiverManager::ReceiverManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<cluster::ClusterRegistry> clusters,
                                 std::shared_ptr<engine::ActionEngine> engine, std::shared_ptr<identity::CredentialDelegator> delegator,
                                 std::shared_ptr<ChannelAllocator> channels, Options options)
    : repository_(std::move(repository)),
      clusters_(std::move(clusters)),
      engine_(std::move(engine)),
      delegator_(std::move(delegator)),
      channels_(std::move(channels)),
      options_(options) {
  if (!repository_ || !clusters_ || !engine_ || !delegator_ || !channels_) {
    throw std::invalid_argument("ReceiverManager requires repository, clusters, engine, delegator and channels");
  }
}

model::Receiver ReceiverManager::Create(const CreateReceiverParams& request, const auth::RequestContext& requester) {
  auth::Enforce(requester, auth::Permission::kCreateReceiver);

  if (request.name.empty()) {
    throw util::InvalidArgument(InvalidValue(request.name, "name"));
  }

  const auto type = model::ParseReceiverType(request.type);
  if (!type) {
    throw util::InvalidArgument("invalid receiver type '" + request.type + "'");
  }

  if (!engine_->IsKnownAction(request.action)) {
    throw util::InvalidArgument("unknown action '" + request.action + "'");
  }

  const auto cluster = clusters_->Resolve(request.cluster, requester);
  if (!cluster) {
    throw util::NotFound("cluster '" + request.cluster + "' not found");
  }

  {
    auto tx       = BeginOrThrow(*repository_, "create receiver");
    auto existing = repository_->GetReceiverByName(*tx, requester.project, request.name);
    CommitOrThrow(*tx, "create receiver");
    if (existing) {
      throw util::AlreadyExists("a receiver named '" + request.name + "' already exists");
    }
  }

  const auto now = util::FromUnixMillis(util::ToUnixMillis(util::Now()));

  model::Receiver receiver;
  receiver.id         = util::NewId();
  receiver.name       = request.name;
  receiver.type       = *type;
  receiver.cluster_id = cluster->id;
  receiver.action     = request.action;
  receiver.actor      = request.actor;
  receiver.params     = request.params;
  receiver.project    = requester.project;
  receiver.domain     = requester.domain;
  receiver.user       = requester.user;
  receiver.created_at = now;
  receiver.updated_at = now;

  // trust ids are only ever minted here
  receiver.actor.erase(std::string(model::kTrustIdKey));

  identity::CredentialHandle handle;
  if (receiver.type == model::ReceiverType::kWebhook) {
    handle = delegator_->Issue(requester, identity::DelegationScope{receiver.cluster_id, receiver.action});
    receiver.actor[std::string(model::kTrustIdKey)] = handle.trust_id;
  }

  try {
    auto tx = BeginOrThrow(*repository_, "create receiver");
    ThrowIfDbError(repository_->InsertReceiver(*tx, ToRecord(receiver)), "create receiver");
    CommitOrThrow(*tx, "create receiver");
  } catch (const std::exception& e) {
    if (handle) {
      RECEIVER_LOG_WARN("receiver not persisted; revoking delegated credential",
                        {StringField("receiver_id", receiver.id), StringField("trust_id", handle.trust_id), StringField("error", e.what())});
      RevokeQuietly(handle, receiver.id);
    }
    throw;
  }

  RECEIVER_LOG_INFO("receiver created", {StringField("receiver_id", receiver.id), StringField("name", receiver.name),
                                         StringField("type", model::ToString(receiver.type)), StringField("cluster_id", receiver.cluster_id),
                                         StringField("project", receiver.project)});
  return WithChannel(std::move(receiver));
}

void ReceiverManager::Delete(const std::string& identity, const auth::RequestContext& requester) {
  auto record = Lookup(identity, requester);
  if (!record) {
    throw util::NotFound("receiver '" + identity + "' not found");
  }

  auth::Enforce(requester, auth::Permission::kDeleteReceiver);

  const auto receiver = FromRecord(*record);
  if (const auto trust_id = receiver.TrustId()) {
    RevokeQuietly(identity::CredentialHandle{*trust_id}, receiver.id);
  }

  auto tx = BeginOrThrow(*repository_, "delete receiver '" + receiver.id + "'");
  ThrowIfDbError(repository_->DeleteReceiver(*tx, receiver.id), "delete receiver '" + receiver.id + "'");
  CommitOrThrow(*tx, "delete receiver '" + receiver.id + "'");

  RECEIVER_LOG_INFO("receiver deleted", {StringField("receiver_id", receiver.id), StringField("project", receiver.project)});
}

model::Receiver ReceiverManager::Get(const std::string& identity, const auth::RequestContext& requester) {
  auth::Enforce(requester, auth::Permission::kGetReceiver);

  auto record = Lookup(identity, requester);
  if (!record) {
    throw util::NotFound("receiver '" + identity + "' not found");
  }
  return WithChannel(FromRecord(*record));
}

ReceiverPage ReceiverManager::List(const ListReceiversParams& query, const auth::RequestContext& requester) {
  auth::Enforce(requester, auth::Permission::kListReceivers);
  if (query.global_project) {
    auth::Enforce(requester, auth::Permission::kListGlobalProject);
  }

  for (const auto& type : query.types) {
    if (!model::ParseReceiverType(type)) {
      throw util::InvalidArgument(InvalidValue(type, "type"));
    }
  }

  auto sort   = ListQuery::ParseSort(query.sort);
  auto limit  = ListQuery::ResolveLimit(query.limit, options_.default_limit, options_.max_limit);
  auto marker = query.marker.empty() ? std::nullopt : std::optional<Marker>(ListQuery::DecodeMarker(query.marker));
  ListQuery list_query(std::move(sort), std::move(marker), limit);

  db::ReceiverFilter filter;
  if (!query.global_project) {
    filter.project = requester.project;
  }
  filter.names       = query.names;
  filter.types       = query.types;
  filter.cluster_ids = query.cluster_ids;
  filter.actions     = query.actions;

  auto tx      = BeginOrThrow(*repository_, "list receivers");
  auto records = repository_->ListReceivers(*tx, filter);
  CommitOrThrow(*tx, "list receivers");

  auto page = list_query.Apply(std::move(records));

  ReceiverPage out;
  out.receivers.reserve(page.records.size());
  for (const auto& record : page.records) {
    out.receivers.push_back(WithChannel(FromRecord(record)));
  }
  out.next_marker = std::move(page.next_marker);
  return out;
}

std::optional<model::Receiver> ReceiverManager::Find(const std::string& receiver_id) {
  auto tx     = BeginOrThrow(*repository_, "find receiver '" + receiver_id + "'");
  auto record = repository_->GetReceiver(*tx, receiver_id);
  CommitOrThrow(*tx, "find receiver '" + receiver_id + "'");

  if (!record) {
    return std::nullopt;
  }
  return WithChannel(FromRecord(*record));
}

std::optional<db::model::ReceiverRecord> ReceiverManager::Lookup(const std::string& identity, const auth::RequestContext& requester) {
  if (identity.empty()) {
    return std::nullopt;
  }

  auto tx = BeginOrThrow(*repository_, "get receiver '" + identity + "'");

  std::optional<db::model::ReceiverRecord> record;
  if (util::LooksLikeUUID(identity)) {
    record = repository_->GetReceiver(*tx, identity);
  }
  if (!record) {
    record = repository_->GetReceiverByName(*tx, requester.project, identity);
  }
  CommitOrThrow(*tx, "get receiver '" + identity + "'");

  if (record && !IsVisible(*record, requester)) {
    return std::nullopt;
  }
  return record;
}

model::Receiver ReceiverManager::WithChannel(model::Receiver receiver) const {
  receiver.channel = channels_->Allocate(receiver.id, receiver.type);
  return receiver;
}

void ReceiverManager::RevokeQuietly(const identity::CredentialHandle& handle, const std::string& receiver_id) {
  try {
    delegator_->Revoke(handle);
  } catch (const util::AlreadyRevoked& e) {
    RECEIVER_LOG_INFO("delegated credential already revoked",
                      {StringField("receiver_id", receiver_id), StringField("trust_id", handle.trust_id), StringField("detail", e.what())});
  } catch (const util::CredentialInvalid& e) {
    RECEIVER_LOG_WARN("delegated credential invalid during revoke",
                      {StringField("receiver_id", receiver_id), StringField("trust_id", handle.trust_id), StringField("error", e.what())});
  } catch (const util::RevocationFailed& e) {
    RECEIVER_LOG_WARN("failed to revoke delegated credential",
                      {StringField("receiver_id", receiver_id), StringField("trust_id", handle.trust_id), StringField("error", e.what())});
  }
}

} // namespace receiver::core
