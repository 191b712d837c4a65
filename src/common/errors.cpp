
#include "errors.hpp"

namespace ferry {

namespace {

class TransferCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "ferry.transfer"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::empty_file:
      return "no file selected";
    case errc::no_target:
      return "no target selected";
    case errc::busy:
      return "already busy with this peer";
    case errc::target_not_found:
      return "target not found";
    case errc::target_busy:
      return "target is busy";
    case errc::rejected:
      return "offer rejected";
    case errc::establish_timeout:
      return "channel establishment timed out";
    case errc::channel_closed:
      return "channel closed";
    case errc::send_failed:
      return "send failed";
    case errc::peer_lost:
      return "peer disconnected";
    case errc::cancelled:
      return "transfer cancelled";
    case errc::stalled:
      return "transfer stalled";
    case errc::incomplete:
      return "transfer incomplete";
    case errc::integrity:
      return "integrity check failed";
    case errc::io_error:
      return "local file I/O failed";
    }
    return "unknown transfer error";
  }
};

} // namespace

const std::error_category &transfer_category() {
  static TransferCategory cat;
  return cat;
}

} // namespace ferry
