#pragma once

#include <memory>
#include <string>
#include <vector>

namespace mirrorguard::sync {

/*
  Pushes file-store state of the given entity types into the
  relational mirror. Idempotent; callers may pass duplicates or a
  superset of the types that actually changed.
*/
class SynchronizationProcess {
 public:
  virtual ~SynchronizationProcess() = default;

  virtual void Synchronize(const std::vector<std::string>& entity_names) = 0;
};

using SynchronizationProcessPtr = std::shared_ptr<SynchronizationProcess>;

} // namespace mirrorguard::sync
