#ifndef HTTP_GATEWAY_HPP
#define HTTP_GATEWAY_HPP

#include "httplib.h"
#include "config.hpp"
#include "object_store.hpp"
#include "presigner.hpp"

// Installs the /files and /health routes. `store` and `presigner` must outlive `svr`.
void RegisterRoutes(httplib::Server& svr, ObjectStore& store, const Presigner& presigner,
                    const Config::ServerConfig& config);

// Binds and serves until svr.stop(). Returns false if the listen address could not be bound.
bool RunHTTPServer(httplib::Server& svr, const Config::ServerConfig& config);

#endif // HTTP_GATEWAY_HPP
