// Repository: Probekit-core
// Component: Shell Session Factory
// Purpose: Adapts ShellSession to the resource pool.
// Copyright (c) 2025 Probekit

#include "probekit/session/ShellSessionFactory.hpp"

#include <sstream>

#include "probekit/util/Logger.hpp"

namespace probekit::session {

namespace {

// Length-prefixed so no field value can collide with a separator.
void AppendField(std::ostringstream& oss, const std::string& value) {
  oss << value.size() << ':' << value << ';';
}

}  // namespace

ShellSessionFactory::ShellSessionFactory(process::ProcessSupervisor& supervisor)
    : supervisor_(supervisor) {}

std::shared_ptr<ShellSession> ShellSessionFactory::Create(const ShellConfig& config) {
  auto session = std::make_shared<ShellSession>(supervisor_, config);
  session->Start();
  return session;
}

bool ShellSessionFactory::Reset(ShellSession& session) {
  if (!session.IsRunning()) {
    util::Logger::Debug("[ShellSessionFactory] reset rejected, pid=" +
                        std::to_string(session.pid()) + " is not running");
    return false;
  }
  session.ClearOutput();
  session.ClearInputHistory();
  return true;
}

void ShellSessionFactory::Destroy(ShellSession& session) {
  session.Destroy();
}

std::string ShellSessionFactory::ConfigKey(const ShellConfig& config) const {
  std::ostringstream oss;
  oss << "shell=";
  AppendField(oss, config.shell);
  oss << "args=" << config.args.size() << '[';
  for (const auto& arg : config.args) AppendField(oss, arg);
  oss << "]cwd=";
  AppendField(oss, config.cwd);
  if (!config.env) {
    oss << "env=inherit";
  } else {
    // std::map iterates by name.
    oss << "env=" << config.env->size() << '{';
    for (const auto& [name, value] : *config.env) {
      AppendField(oss, name);
      AppendField(oss, value);
    }
    oss << '}';
  }
  return oss.str();
}

}  // namespace probekit::session
