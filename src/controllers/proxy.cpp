#include <controllers/proxy.hpp>
#include <support/forwarding.hpp>
#include <support/multipart.hpp>
#include <support/reformat.hpp>
#include <drogon/HttpClient.h>
#include <thread>

namespace imgrelay {
    namespace {
        constexpr double kDownstreamTimeout = 10.0; // seconds

        drogon::HttpResponsePtr textResponse(drogon::HttpStatusCode code, const std::string& body) {
            auto resp = drogon::HttpResponse::newHttpResponse();
            resp->setStatusCode(code);
            resp->setContentTypeCode(drogon::CT_TEXT_PLAIN);
            resp->setBody(body);
            return resp;
        }
    }

    ProxyController::ProxyController(Config config, std::shared_ptr<const image::ImageCodec> codec)
        : config_(std::move(config)), codec_(std::move(codec)) {
        splitUrl(config_.forwardDestination, destinationHost_, destinationPath_);
    }

    void ProxyController::registerRoutes() {
        auto self = shared_from_this();
        drogon::app().registerHandler(
            config_.listenPath,
            [self](const drogon::HttpRequestPtr& req, std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
                self->handleListenPath(req, std::move(callback));
            },
            {drogon::Get, drogon::Post, drogon::Put, drogon::Patch, drogon::Delete, drogon::Options});

        drogon::app().setDefaultHandler(
            [self](const drogon::HttpRequestPtr& req, std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
                self->forward(req, std::move(callback));
            });

        LOG_INFO << "Listening for uploads on " << config_.listenPath << ", forwarding to " << config_.forwardDestination;
    }

    void ProxyController::handleListenPath(const drogon::HttpRequestPtr& req, Callback_t callback) {
        if (isMultipartFormData(req->getHeader("content-type"))) {
            uploadImage(req, std::move(callback));
        } else {
            forward(req, std::move(callback));
        }
    }

    void ProxyController::uploadImage(const drogon::HttpRequestPtr& req, Callback_t callback) {
        if (req->body().size() > config_.uploadMaxSize) {
            LOG_WARN << "Rejected upload of " << req->body().size() << " bytes (limit " << config_.uploadMaxSize << ")";
            callback(textResponse(drogon::k413RequestEntityTooLarge, "Upload exceeds the maximum size"));
            return;
        }

        std::string boundary = extractBoundary(req->getHeader("content-type"));
        if (boundary.empty()) {
            callback(textResponse(drogon::k400BadRequest, "Missing multipart boundary"));
            return;
        }

        auto shared_callback = std::make_shared<std::function<void(const drogon::HttpResponsePtr &)>>(std::move(callback));
        auto body = std::make_shared<std::string>(req->body());
        auto self = shared_from_this();

        // Image work stays off the IO loop
        std::thread([self, req, body, boundary, shared_callback]() {
            try {
                auto form = parseMultipartForm(*body, boundary);
                if (!form) {
                    LOG_WARN << "Malformed multipart body from " << req->peerAddr().toIp();
                    (*shared_callback)(textResponse(drogon::k400BadRequest, "Malformed multipart body"));
                    return;
                }

                ReformatResult reformatted = reformat(*form, self->config_, *self->codec_);
                if (!reformatted.ok()) {
                    LOG_WARN << "Upload rejected: " << reformatted.error;
                    (*shared_callback)(textResponse(drogon::k400BadRequest, reformatted.error));
                    return;
                }

                auto downstream = buildUploadRequest(req, self->destinationPath_, reformatted.contentType,
                                                     std::move(reformatted.body));
                self->sendDownstream(downstream, shared_callback);
            } catch (const std::exception& e) {
                LOG_ERROR << "Upload processing failed: " << e.what();
                (*shared_callback)(textResponse(drogon::k500InternalServerError, "Upload processing failed"));
            }
        }).detach();
    }

    void ProxyController::forward(const drogon::HttpRequestPtr& req, Callback_t callback) {
        LOG_INFO << "Relaying " << req->methodString() << " " << req->path();
        auto shared_callback = std::make_shared<std::function<void(const drogon::HttpResponsePtr &)>>(std::move(callback));
        sendDownstream(buildRelayRequest(req), shared_callback);
    }

    void ProxyController::sendDownstream(const drogon::HttpRequestPtr& req, SharedCallback_t callback) const {
        auto client = drogon::HttpClient::newHttpClient(destinationHost_);
        std::string target = destinationHost_ + req->path();
        client->sendRequest(req, [client, callback, target](drogon::ReqResult result, const drogon::HttpResponsePtr& resp) {
            if (result != drogon::ReqResult::Ok || !resp) {
                std::string reason = drogon::to_string(result);
                LOG_ERROR << "Forwarding to " << target << " failed: " << reason;
                (*callback)(textResponse(drogon::k424FailedDependency, "Forwarding failed: " + reason));
                return;
            }
            LOG_DEBUG << "Downstream " << target << " answered " << static_cast<int>(resp->statusCode());
            (*callback)(relayResponse(resp));
        }, kDownstreamTimeout);
    }
}
