
#include <format>

#include "Worker.h"
#include "logging.h"

using namespace std;

namespace logfault {
std::pair<bool /* json */, std::string /* content or json */> toLog(const vin::WorkerBase& w, bool json) {
    if (json) {
        return make_pair(true, format(R"("worker":"{}")", w.name()));
    }

    return make_pair(false, format("{}", w.name()));
}
} // logfault ns
