/**
 * @file grpc_gateway.cpp
 * @brief gRPC Gateway implementation (synchronous gRPC server)
 */

#include <loadscaler/microservice/grpc_gateway.hpp>

#include "externalscaler.grpc.pb.h"

#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace loadscaler::microservice {

namespace {

constexpr const char* kServiceName = "externalscaler.ExternalScaler";

LoadScaler::ScaledObjectRef fromProto(const externalscaler::ScaledObjectRef& ref) {
    LoadScaler::ScaledObjectRef out;
    out.name = ref.name();
    out.ns = ref.namespace_();
    out.scaler_metadata.reserve(ref.scalermetadata().size());
    for (const auto& entry : ref.scalermetadata()) {
        out.scaler_metadata.emplace(entry.first, entry.second);
    }
    return out;
}

grpc::Status toGrpcStatus(const LoadScaler::QueryStatus& status) {
    switch (status.code) {
        case LoadScaler::StatusCode::OK:
            return grpc::Status::OK;
        case LoadScaler::StatusCode::INVALID_ARGUMENT:
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, status.message);
        case LoadScaler::StatusCode::UNIMPLEMENTED:
            return grpc::Status(grpc::StatusCode::UNIMPLEMENTED, status.message);
        default:
            return grpc::Status(grpc::StatusCode::UNKNOWN, status.message);
    }
}

class ExternalScalerService final : public externalscaler::ExternalScaler::Service {
public:
    explicit ExternalScalerService(const LoadScaler::QueryService& queries)
        : queries_(queries) {}

    grpc::Status IsActive(grpc::ServerContext*,
                          const externalscaler::ScaledObjectRef* request,
                          externalscaler::IsActiveResponse* reply) override {
        LoadScaler::IsActiveResponse response;
        auto status = queries_.isActive(fromProto(*request), &response);
        if (status.ok()) {
            reply->set_result(response.result);
        }
        return toGrpcStatus(status);
    }

    grpc::Status StreamIsActive(grpc::ServerContext*,
                                const externalscaler::ScaledObjectRef* request,
                                grpc::ServerWriter<externalscaler::IsActiveResponse>*) override {
        return toGrpcStatus(queries_.streamIsActive(fromProto(*request)));
    }

    grpc::Status GetMetricSpec(grpc::ServerContext*,
                               const externalscaler::ScaledObjectRef* request,
                               externalscaler::GetMetricSpecResponse* reply) override {
        LoadScaler::GetMetricSpecResponse response;
        auto status = queries_.getMetricSpec(fromProto(*request), &response);
        if (status.ok()) {
            // targetSize (int64) is deprecated by KEDA and left at 0
            for (const auto& spec : response.metric_specs) {
                auto* out = reply->add_metricspecs();
                out->set_metricname(spec.metric_name);
                out->set_targetsizefloat(spec.target_size);
            }
        }
        return toGrpcStatus(status);
    }

    grpc::Status GetMetrics(grpc::ServerContext*,
                            const externalscaler::GetMetricsRequest* request,
                            externalscaler::GetMetricsResponse* reply) override {
        LoadScaler::GetMetricsRequest query;
        query.scaled_object = fromProto(request->scaledobjectref());
        query.metric_name = request->metricname();

        LoadScaler::GetMetricsResponse response;
        auto status = queries_.getMetrics(query, &response);
        if (status.ok()) {
            // metricValue (int64) is deprecated by KEDA and left at 0
            for (const auto& value : response.metric_values) {
                auto* out = reply->add_metricvalues();
                out->set_metricname(value.metric_name);
                out->set_metricvaluefloat(value.value);
            }
        }
        return toGrpcStatus(status);
    }

private:
    const LoadScaler::QueryService& queries_;
};

} // namespace

struct GrpcGateway::Impl {
    GrpcConfig config;
    ExternalScalerService service;
    std::unique_ptr<grpc::Server> server;
    int bound_port = 0;
    bool running = false;

    Impl(const GrpcConfig& c, const LoadScaler::QueryService& queries)
        : config(c), service(queries) {}
};

GrpcGateway::GrpcGateway(const GrpcConfig& config, const LoadScaler::QueryService& queries)
    : impl_(std::make_unique<Impl>(config, queries)) {
}

GrpcGateway::~GrpcGateway() {
    stop();
}

bool GrpcGateway::start() {
    if (impl_->running) {
        return true;
    }

    spdlog::info("[GrpcGateway] Starting KEDA external scaler server on {}", get_address());

    grpc::EnableDefaultHealthCheckService(true);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(get_address(), grpc::InsecureServerCredentials(), &impl_->bound_port);
    builder.SetMaxReceiveMessageSize(static_cast<int>(impl_->config.max_message_size));
    builder.SetMaxSendMessageSize(static_cast<int>(impl_->config.max_message_size));
    builder.RegisterService(&impl_->service);

    impl_->server = builder.BuildAndStart();
    if (!impl_->server || impl_->bound_port == 0) {
        spdlog::error("[GrpcGateway] Failed to bind {}", get_address());
        impl_->server.reset();
        return false;
    }

    if (auto* health = impl_->server->GetHealthCheckService()) {
        health->SetServingStatus(kServiceName, true);
    }

    impl_->running = true;
    spdlog::info("[GrpcGateway] Listening on {}:{}", impl_->config.host, impl_->bound_port);
    return true;
}

void GrpcGateway::stop() {
    if (!impl_->running) {
        return;
    }

    spdlog::info("[GrpcGateway] Stopping gRPC Gateway");
    if (auto* health = impl_->server->GetHealthCheckService()) {
        health->SetServingStatus(kServiceName, false);
    }
    impl_->server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
    impl_->server.reset();
    impl_->running = false;
}

bool GrpcGateway::is_running() const {
    return impl_->running;
}

std::string GrpcGateway::get_address() const {
    return impl_->config.host + ":" + std::to_string(impl_->config.port);
}

int GrpcGateway::bound_port() const {
    return impl_->bound_port;
}

} // namespace loadscaler::microservice
