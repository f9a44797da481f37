#pragma once

#include <functional>
#include <string>
#include <vector>

#include "transport/http_transport.hpp"

// Invoked on every request right before it is sent.
using AuthDecorator = std::function<void(HttpRequest&)>;

AuthDecorator bearer_auth(std::string token);

// The provider is asked for a token on every attempt, so rotated tokens are
// picked up by the next retry. An empty token leaves the request untouched.
AuthDecorator bearer_auth(std::function<std::string()> token_provider);

AuthDecorator header_auth(std::string name, std::string value);

AuthDecorator chain_auth(std::vector<AuthDecorator> decorators);
