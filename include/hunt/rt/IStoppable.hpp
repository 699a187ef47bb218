#pragma once
namespace hunt::rt {
struct IStoppable {
  virtual ~IStoppable() = default;
  virtual void stop() = 0; // idempotent
};
} // namespace hunt::rt
