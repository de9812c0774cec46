#ifndef IMGRELAY_PROXY_HPP
#define IMGRELAY_PROXY_HPP

#include <support/config.hpp>
#include <support/controllers.hpp>
#include <support/image_codec.hpp>
#include <memory>
#include <string>

namespace imgrelay {
    /**
     * @brief Upload rewriting proxy. Multipart requests on config.listenPath have their
     *        image processed before being sent to config.forwardDestination; every other
     *        request is relayed to the destination host untouched.
     *
     * Routes are added at runtime because the listen path comes from the configuration.
     */
    class ProxyController : public std::enable_shared_from_this<ProxyController> {
    public:
        ProxyController(Config config, std::shared_ptr<const image::ImageCodec> codec);

        // Registers listenPath for the common methods and the default handler on drogon::app().
        void registerRoutes();

        void handleListenPath(const drogon::HttpRequestPtr& req, Callback_t callback);
        void uploadImage(const drogon::HttpRequestPtr& req, Callback_t callback);
        void forward(const drogon::HttpRequestPtr& req, Callback_t callback);

        const Config& config() const { return config_; }

    private:
        void sendDownstream(const drogon::HttpRequestPtr& req, SharedCallback_t callback) const;

        Config config_;
        std::shared_ptr<const image::ImageCodec> codec_;
        std::string destinationHost_;
        std::string destinationPath_;
    };
}

#endif //IMGRELAY_PROXY_HPP
