#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "timekeeper/v1.hpp"

using namespace timekeeper::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  timekeeperctl <addr> [--user <id>] [--config <yaml>] create <description>\n"
            << "  timekeeperctl <addr> [--user <id>] [--config <yaml>] get <match_id>\n"
            << "  timekeeperctl <addr> [--user <id>] [--config <yaml>] watch <match_id> [interval_ms]\n"
            << "  timekeeperctl <addr> [--user <id>] [--config <yaml>] pause|resume|reset|stop <match_id>\n"
            << "  timekeeperctl <addr> [--user <id>] [--config <yaml>] delete <match_id>\n"
            << "  timekeeperctl <addr> [--user <id>] [--config <yaml>] follow <match_id or scanned text>\n"
            << "  timekeeperctl <addr> [--user <id>] [--config <yaml>] unfollow <match_id>\n"
            << "  timekeeperctl <addr> [--user <id>] [--config <yaml>] list\n"
            << "\n"
            << "The user id defaults to $TIMEKEEPER_USER. watch polls every timer.update_interval_ms\n"
            << "of the config file (1000 ms without one) unless interval_ms is given.\n";
}

// One line per status code; what a person at the terminal should read.
static std::string Describe(const grpc::Status& status) {
  switch (status.error_code()) {
    case grpc::StatusCode::NOT_FOUND:
      return "match not found: " + status.error_message();
    case grpc::StatusCode::INVALID_ARGUMENT:
      return "invalid input: " + status.error_message();
    case grpc::StatusCode::FAILED_PRECONDITION:
      return "match has ended: " + status.error_message();
    case grpc::StatusCode::PERMISSION_DENIED:
      return "not allowed: only the match admin can do this";
    case grpc::StatusCode::UNAVAILABLE:
      return "timer storage is unavailable, try again shortly: " + status.error_message();
    case grpc::StatusCode::DATA_LOSS:
      return "timer storage is damaged, contact support: " + status.error_message();
    default:
      return "request failed: " + status.error_message();
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << Describe(status) << "\n";
  return 2;
}

static const char* PhaseName(TimerPhase phase) {
  switch (phase) {
    case TIMER_PHASE_IDLE:
      return "paused";
    case TIMER_PHASE_RUNNING:
      return "running";
    case TIMER_PHASE_EXPIRED:
      return "expired";
    default:
      return "unknown";
  }
}

static void Print(const MatchView& view) {
  const auto& m = view.match();
  std::cout << m.match_id() << "  " << view.clock() << "  " << PhaseName(view.phase())
            << (m.is_active() ? "" : "  (ended)") << (view.is_admin() ? "  [admin]" : "") << "  " << m.description()
            << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::vector<std::string> args(argv + 1, argv + argc);
  std::string              addr = args[0];

  std::string user;
  if (const char* env = std::getenv("TIMEKEEPER_USER")) {
    user = env;
  }

  std::string config_path;
  std::size_t pos = 1;
  while (pos + 1 < args.size() && (args[pos] == "--user" || args[pos] == "--config")) {
    (args[pos] == "--user" ? user : config_path) = args[pos + 1];
    pos += 2;
  }
  if (pos >= args.size()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[pos];
  const auto        arg = [&](std::size_t i) -> const std::string* {
    return pos + i < args.size() ? &args[pos + i] : nullptr;
  };

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = MatchTimerService::NewStub(channel);

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (!arg(1)) return 1;

    CreateMatchRequest req;
    req.set_user_id(user);
    req.set_description(*arg(1));

    grpc::ClientContext ctx;
    CreateMatchResponse resp;
    auto                status = stub->CreateMatch(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.view());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (!arg(1)) return 1;

    GetMatchRequest req;
    req.set_user_id(user);
    req.set_match_id(*arg(1));

    grpc::ClientContext ctx;
    GetMatchResponse    resp;
    auto                status = stub->GetMatch(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.view());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    if (!arg(1)) return 1;

    int interval_ms = static_cast<int>(timekeeper::config::kDefaultUpdateIntervalMs);
    if (!config_path.empty()) {
      try {
        interval_ms = static_cast<int>(timekeeper::config::ConfigLoader::LoadFromYaml(config_path).timer().update_interval_ms());
      } catch (const std::exception& e) {
        std::cerr << "config error: " << e.what() << "\n";
        return 1;
      }
    }
    if (arg(2)) interval_ms = std::atoi(arg(2)->c_str());

    if (interval_ms <= 0) {
      std::cerr << "interval_ms must be positive\n";
      return 1;
    }

    GetMatchRequest req;
    req.set_user_id(user);
    req.set_match_id(*arg(1));

    // Nothing is pushed; re-read until the match ends or a read fails.
    for (;;) {
      grpc::ClientContext ctx;
      GetMatchResponse    resp;
      auto                status = stub->GetMatch(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.view());
      if (!resp.view().match().is_active() || resp.view().phase() == TIMER_PHASE_EXPIRED) {
        return 0;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
    }
  }

  // ------------------------------------------------------------

  if (cmd == "pause" || cmd == "resume" || cmd == "reset" || cmd == "stop") {
    if (!arg(1)) return 1;

    ControlTimerRequest req;
    req.set_user_id(user);
    req.set_match_id(*arg(1));
    req.set_operation(cmd);

    grpc::ClientContext  ctx;
    ControlTimerResponse resp;
    auto                 status = stub->ControlTimer(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.view());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (!arg(1)) return 1;

    DeleteMatchRequest req;
    req.set_user_id(user);
    req.set_match_id(*arg(1));

    grpc::ClientContext     ctx;
    google::protobuf::Empty resp;
    auto                    status = stub->DeleteMatch(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "follow") {
    if (!arg(1)) return 1;

    FollowMatchRequest req;
    req.set_user_id(user);
    req.set_match_ref(*arg(1));

    grpc::ClientContext ctx;
    FollowMatchResponse resp;
    auto                status = stub->FollowMatch(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.view());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "unfollow") {
    if (!arg(1)) return 1;

    UnfollowMatchRequest req;
    req.set_user_id(user);
    req.set_match_id(*arg(1));

    grpc::ClientContext     ctx;
    google::protobuf::Empty resp;
    auto                    status = stub->UnfollowMatch(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "unfollowed\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListActiveMatchesRequest req;
    req.set_user_id(user);

    grpc::ClientContext       ctx;
    ListActiveMatchesResponse resp;
    auto                      status = stub->ListActiveMatches(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& view : resp.matches()) {
      Print(view);
    }
    if (resp.matches_size() == 0) {
      std::cout << "no active matches\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
