#ifndef IMGRELAY_CONTROLLERS_HPP
#define IMGRELAY_CONTROLLERS_HPP
#include <drogon/drogon.h>
#include <functional>
#include <memory>

namespace imgrelay {
    using Callback_t = std::function<void(const drogon::HttpResponsePtr &)>&&;
    // Callback handed to a worker thread or a client completion
    using SharedCallback_t = std::shared_ptr<std::function<void(const drogon::HttpResponsePtr &)>>;
}

#endif //IMGRELAY_CONTROLLERS_HPP
