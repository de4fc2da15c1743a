/**
 * @file grpc_gateway.hpp
 * @brief gRPC Gateway for LoadScaler
 *
 * Serves the KEDA externalscaler.ExternalScaler service on top of the
 * QueryService, plus the standard gRPC health service.
 */

#pragma once

#include <string>
#include <memory>
#include <cstdint>

#include <loadscaler/core/scaler/query_service.hpp>

namespace loadscaler::microservice {

/**
 * @brief gRPC Gateway configuration
 */
struct GrpcConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 9090;           // 0 = pick a free port
    size_t max_message_size = 4 * 1024 * 1024;  // 4MB
};

/**
 * @brief gRPC Gateway for LoadScaler
 *
 * Translates protobuf messages to the wire-independent scaler types and
 * QueryStatus codes to grpc::Status codes.
 */
class GrpcGateway {
public:
    GrpcGateway(const GrpcConfig& config, const LoadScaler::QueryService& queries);
    ~GrpcGateway();

    // Non-copyable
    GrpcGateway(const GrpcGateway&) = delete;
    GrpcGateway& operator=(const GrpcGateway&) = delete;

    /**
     * @brief Start the gRPC server
     * @return true if started successfully
     */
    bool start();

    /**
     * @brief Stop the gRPC server gracefully
     */
    void stop();

    /**
     * @brief Check if server is running
     */
    bool is_running() const;

    /**
     * @brief Get configured listen address
     */
    std::string get_address() const;

    /**
     * @brief Port actually bound (valid after start())
     */
    int bound_port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace loadscaler::microservice
