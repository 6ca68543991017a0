#pragma once

#include <deque>
#include <mutex>
#include <vector>

#include "signer/token_signer.hpp"
#include "transport/i_transport.hpp"

namespace apnsclient::testutil {

// Replays scripted outcomes and records every request it was given.
class FakeTransport : public ITransport {
public:
  void enqueue(ApnsResult<GatewayReply> outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.push_back(std::move(outcome));
  }

  void enqueue_reply(int status, std::string body = {},
                     HeaderMap headers = {}) {
    GatewayReply reply;
    reply.status = status;
    reply.body = std::move(body);
    reply.headers = std::move(headers);
    enqueue(ApnsResult<GatewayReply>::Ok(std::move(reply)));
  }

  ApnsResult<GatewayReply> round_trip(const GatewayRequest &request,
                                      std::chrono::milliseconds timeout) override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    timeouts_.push_back(timeout);
    if (outcomes_.empty()) {
      return ApnsResult<GatewayReply>::Err(timed_out());
    }
    auto outcome = std::move(outcomes_.front());
    outcomes_.pop_front();
    return outcome;
  }

  const std::vector<GatewayRequest> &requests() const { return requests_; }
  const std::vector<std::chrono::milliseconds> &timeouts() const {
    return timeouts_;
  }

private:
  std::mutex mutex_;
  std::deque<ApnsResult<GatewayReply>> outcomes_;
  std::vector<GatewayRequest> requests_;
  std::vector<std::chrono::milliseconds> timeouts_;
};

class StaticSigner : public ITokenSigner {
public:
  explicit StaticSigner(ApnsResult<std::string> outcome)
      : outcome_(std::move(outcome)) {}

  ApnsResult<std::string> bearer_token() override {
    ++calls_;
    return outcome_;
  }

  int calls() const { return calls_; }

private:
  ApnsResult<std::string> outcome_;
  int calls_{0};
};

} // namespace apnsclient::testutil
