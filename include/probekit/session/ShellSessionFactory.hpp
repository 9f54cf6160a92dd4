// Repository: Probekit-core
// Component: Shell Session Factory
// Purpose: Adapts ShellSession to the resource pool.
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_SESSION_SHELL_SESSION_FACTORY_HPP_
#define PROBEKIT_SESSION_SHELL_SESSION_FACTORY_HPP_

#include <memory>
#include <string>

#include "probekit/pool/IResourceFactory.hpp"
#include "probekit/pool/ResourcePool.hpp"
#include "probekit/process/ProcessSupervisor.hpp"
#include "probekit/session/ShellSession.hpp"

namespace probekit::session {

class ShellSessionFactory : public pool::IResourceFactory<ShellSession, ShellConfig> {
 public:
  explicit ShellSessionFactory(process::ProcessSupervisor& supervisor);

  std::shared_ptr<ShellSession> Create(const ShellConfig& config) override;
  // Clears output and input history; false for a session whose shell died.
  bool Reset(ShellSession& session) override;
  void Destroy(ShellSession& session) override;
  // shell, args, cwd and env (by name) decide reuse; timeouts and buffer size do not.
  std::string ConfigKey(const ShellConfig& config) const override;
  std::string TypeName() const override { return "shell"; }

 private:
  process::ProcessSupervisor& supervisor_;
};

using ShellSessionPool = pool::ResourcePool<ShellSession, ShellConfig>;

}  // namespace probekit::session

#endif  // PROBEKIT_SESSION_SHELL_SESSION_FACTORY_HPP_
