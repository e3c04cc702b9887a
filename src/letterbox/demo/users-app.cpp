#include "stdinc.hpp"

#include "users-app.hpp"

#include "letterbox/rpc/status.hpp"

#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace letterbox::demo {

namespace {
Json::Value make_user(const std::string& id, const std::string& name) {
  Json::Value user{Json::objectValue};
  user["kind"] = "user";
  user["id"] = id;
  user["name"] = name;
  return user;
}

Json::Value public_view(const Json::Value& record) {
  Json::Value user{Json::objectValue};
  user["id"] = record["id"];
  user["name"] = record["name"];
  return user;
}
} // namespace

// ------------------------------------------------------------------------------------- make_router

rpc::Router UsersApp::make_router() {
  namespace schema = rpc::schema;
  auto self = shared_from_this();

  rpc::Router router;
  router.add("userCreate",
             schema::object({{"name", schema::string()},
                             {"optionalDelay", schema::number().optional()}}),
             [self](const Json::Value& input, rpc::CallContext& context) {
               return self->create_user_(input, context);
             });
  router.add("userUpdateName",
             schema::object({{"id", schema::string()}, {"name", schema::string()}}),
             [self](const Json::Value& input, rpc::CallContext& context) {
               return self->update_name_(input, context);
             });
  return router;
}

// ----------------------------------------------------------------------------------- current_users

Json::Value UsersApp::current_users(const document::ReplicatedDocument& users) {
  std::vector<std::string> order;
  std::unordered_map<std::string, Json::Value> latest;
  for (const auto& record : users.read_all()) {
    if (!record.isObject() || record["kind"] != Json::Value{"user"} || !record["id"].isString())
      continue;
    const auto id = record["id"].asString();
    if (latest.count(id) == 0)
      order.push_back(id);
    latest[id] = public_view(record);
  }

  Json::Value out{Json::arrayValue};
  for (const auto& id : order)
    out.append(latest[id]);
  return out;
}

// ---------------------------------------------------------------------------------- create_user_

Json::Value UsersApp::create_user_(const Json::Value& input, rpc::CallContext& context) {
  const auto name = input["name"].asString();

  const auto requested = input.isMember("optionalDelay") ? input["optionalDelay"].asDouble() : 0.0;
  const auto delay_millis = std::isnan(requested) ? 0.0
                                                  : std::clamp(requested, 0.0, k_max_delay_millis);
  const auto delay = std::chrono::milliseconds{static_cast<int64_t>(delay_millis)};
  if (delay.count() == 0)
    return insert_user_(name, context);

  // Finish the call when the timer fires
  auto call = context.defer();
  auto timer = std::make_shared<SteadyTimerType>(executor_, delay);
  timer->async_wait([self = shared_from_this(), call, timer,
                     name](const boost::system::error_code& ec) {
    if (ec) {
      call->finish_call(rpc::Status{rpc::StatusCode::CANCELLED, ec.message()});
      return;
    }
    call->complete([&]() { return self->insert_user_(name, *call); });
  });
  return Json::Value{};
}

Json::Value UsersApp::insert_user_(const std::string& name, rpc::CallContext& context) {
  if (name == k_rejected_name)
    throw rpc::ProcedureError{"CONFLICT", k_rejected_message};

  std::lock_guard lock{padlock_};
  auto& users = context.data();
  const auto record = make_user(std::to_string(current_users(users).size() + 1), name);

  // The new user and the response field are one atomic change
  context.transact([&]() {
    users.append({record});
    context.response().set("user", public_view(record));
  });
  return Json::Value{};
}

// ---------------------------------------------------------------------------------- update_name_

Json::Value UsersApp::update_name_(const Json::Value& input, rpc::CallContext& context) {
  const auto id = input["id"].asString();

  std::lock_guard lock{padlock_};
  auto& users = context.data();
  const auto current = current_users(users);
  bool found = false;
  for (const auto& user : current)
    found = found || (user["id"].asString() == id);
  if (!found)
    throw rpc::ProcedureError{"NOT_FOUND", format("no user with id '{}'", id)};

  const auto record = make_user(id, input["name"].asString());
  context.transact([&]() {
    users.append({record});
    context.response().set("user", public_view(record));
  });
  return Json::Value{};
}

} // namespace letterbox::demo
