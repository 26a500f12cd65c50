#include "query.hpp"

#include "logging.hpp"

using boost::system::error_code;

namespace dnsprobe {

void VerifiedQuery::Start(Handler handler) {
  handler_ = std::move(handler);
  client_.AsyncRequest(request_, [self = shared_from_this()](
                                     error_code error,
                                     std::optional<Answer> answer) {
    if (error) {
      auto handler = std::move(self->handler_);
      handler(error, std::nullopt, std::nullopt);
      return;
    }
    self->answer_ = std::move(answer);
    if (!self->recursive_client_) {
      auto handler = std::move(self->handler_);
      handler(error, std::move(self->answer_), std::nullopt);
      return;
    }
    self->Verify();
  });
}

void VerifiedQuery::Verify() {
  auto resolver = AuthoritativeResolver::create(*recursive_client_, settings_,
                                                authoritative_port_);
  resolver->AsyncResolve(
      request_.question().name,
      [self = shared_from_this()](error_code error,
                                  std::vector<Server> servers) {
        if (error) {
          self->FinishVerification(error);
          return;
        }
        self->QueryAuthoritative(std::move(servers));
      });
}

void VerifiedQuery::QueryAuthoritative(std::vector<Server> servers) {
  verification_.authoritative_servers = servers;
  Client authoritative_client(std::move(servers));
  authoritative_client.AsyncRequest(
      request_, [self = shared_from_this()](error_code error,
                                            std::optional<Answer> answer) {
        if (error) {
          self->FinishVerification(error);
          return;
        }
        self->verification_.diff = DiffAnswers(
            answer->raw_message(), self->answer_->raw_message());
        self->verification_.authoritative_answer = std::move(answer);
        self->FinishVerification(error);
      });
}

void VerifiedQuery::FinishVerification(error_code error) {
  if (error) {
    LOG_INFO(<< request_.question().name
             << " verification failed: " << error.message());
  }
  verification_.error = error;
  auto handler = std::move(handler_);
  handler(error_code(), std::move(answer_), std::move(verification_));
}

}  // namespace dnsprobe
