#include "transport/auth.hpp"

AuthDecorator bearer_auth(std::string token)
{
    return [token = std::move(token)](HttpRequest& req) {
        req.set_header("Authorization", "Bearer " + token);
    };
}

AuthDecorator bearer_auth(std::function<std::string()> token_provider)
{
    return [provider = std::move(token_provider)](HttpRequest& req) {
        auto token = provider ? provider() : std::string{};
        if (!token.empty())
            req.set_header("Authorization", "Bearer " + token);
    };
}

AuthDecorator header_auth(std::string name, std::string value)
{
    return [name = std::move(name), value = std::move(value)](HttpRequest& req) {
        req.set_header(name, value);
    };
}

AuthDecorator chain_auth(std::vector<AuthDecorator> decorators)
{
    return [decorators = std::move(decorators)](HttpRequest& req) {
        for (const auto& d : decorators)
            if (d) d(req);
    };
}
