#ifndef DNSPROBE_ENGINE_H_
#define DNSPROBE_ENGINE_H_
#include <boost/asio.hpp>

namespace dnsprobe {

class Engine {
 public:
  static inline Engine& get() {
    static thread_local Engine object;
    return object;
  }

  inline boost::asio::io_context& GetExecutor() { return raw_object_; }

  // runs until every pending operation of the thread has completed
  inline void Run() {
    raw_object_.restart();
    raw_object_.run();
  }

 private:
  boost::asio::io_context raw_object_;
  Engine() = default;
};

}  // namespace dnsprobe
#endif  // DNSPROBE_ENGINE_H_
