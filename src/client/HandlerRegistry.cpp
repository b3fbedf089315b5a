#include "HandlerRegistry.hpp"

namespace mw {
PushHandler HandlerRegistry::registerHandler(FilterPtr filter,
                                             PushHandler handler,
                                             FilterErrorHandler onFilterError) {
  if (!filter || !handler) {
    throw std::invalid_argument("A handler binding needs a filter and handler");
  }
  lock_guard<std::mutex> guard(registryMutex);
  bindings.push_back({filter, handler, onFilterError});
  VLOG(1) << "Registered handler #" << bindings.size() << " ("
          << filterKindToString(filter->getKind()) << ")";
  return handler;
}

bool HandlerRegistry::dispatch(const ClientState& state,
                               const PushEvent& event) {
  vector<HandlerBinding> snapshot;
  {
    lock_guard<std::mutex> guard(registryMutex);
    snapshot = bindings;
  }

  for (int a = 0; a < int(snapshot.size()); a++) {
    const auto& binding = snapshot[a];
    bool matched = false;
    try {
      matched = binding.filter->evaluate(state, event);
    } catch (const UnauthenticatedError& ue) {
      if (binding.onFilterError) {
        binding.onFilterError(ue);
      } else {
        LOG(WARNING) << "Handler #" << (a + 1) << " skipped: " << ue.what();
      }
      continue;
    } catch (const std::exception& e) {
      LOG(ERROR) << "Handler #" << (a + 1)
                 << " skipped, its filter threw on opcode " << event.opcode
                 << ": " << e.what();
      continue;
    }
    if (!matched) {
      continue;
    }

    VLOG(2) << "Event opcode " << event.opcode << " matched handler #"
            << (a + 1);
    try {
      binding.handler(event);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Handler #" << (a + 1)
                 << " threw while handling opcode " << event.opcode << ": "
                 << e.what();
    }
    return true;
  }
  VLOG(2) << "No handler for event opcode " << event.opcode;
  return false;
}

int HandlerRegistry::size() {
  lock_guard<std::mutex> guard(registryMutex);
  return int(bindings.size());
}
}  // namespace mw
