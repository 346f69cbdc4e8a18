#include <qgate/work_queue.h>

namespace qgate {

unsigned ResolveParallelism(unsigned requested) {
  if (requested != 0) {
    return requested;
  }
  const auto hardware = std::thread::hardware_concurrency();
  return hardware == 0 ? 1 : hardware;
}

} // namespace qgate
