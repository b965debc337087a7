#include <boost/ut.hpp>

#include <stdexcept> // std::runtime_error

#include <Xtend++/Utils/Error.hpp>

using namespace boost::ut;
using namespace xtend::utils::error;
using namespace xtend::utils::types;

namespace {
  auto fail_helper() -> Result<i32> {
    ERR(XtendErrorCode::InvalidArgument, "fail");
  }

  auto succeed_helper() -> Result<i32> {
    return 42;
  }

  auto try_test_helper_fail() -> Result<i32> {
    i32 val = TRY(fail_helper());

    return val + 1; // Should not reach here
  }

  auto try_test_helper_success() -> Result<i32> {
    i32 val = TRY(succeed_helper());

    return val + 1; // Should be 43
  }

  auto try_void_helper(const bool fail) -> Result<> {
    auto step = [fail]() -> Result<> {
      if (fail)
        ERR_FMT(XtendErrorCode::IoError, "cannot write '{}'", "cache.txt");
      return {};
    };

    TRY_VOID(step());
    return {};
  }
} // namespace

auto main() -> int {
  "XtendError construction"_test = [] -> void {
    XtendError err(XtendErrorCode::NotFound, "Item not found");

    expect(err.code == XtendErrorCode::NotFound);
    expect(err.message == String("Item not found"));
    expect(err.location.line() > 0);
  };

  "XtendError from exception"_test = [] -> void {
    const std::runtime_error exc("boom");
    const XtendError         err = XtendError::fromException(exc);

    expect(err.code == XtendErrorCode::Other);
    expect(err.message == String("boom"));
  };

  "TRY macro success"_test = [] -> void {
    Result<i32> res = try_test_helper_success();

    expect(res.has_value());
    expect(*res == 43);
  };

  "TRY macro failure"_test = [] -> void {
#ifdef _MSC_VER
    try {
      [[maybe_unused]] Result<i32> res = try_test_helper_fail();
      expect(false); // Should have thrown
    } catch (const XtendError& e) {
      expect(e.code == XtendErrorCode::InvalidArgument);
      expect(e.message == String("fail"));
    }
#else
    Result<i32> res = try_test_helper_fail();

    expect(!res.has_value());
    expect(res.error().code == XtendErrorCode::InvalidArgument);
    expect(res.error().message == String("fail"));
#endif
  };

  "TRY_VOID macro"_test = [] -> void {
    expect(try_void_helper(false).has_value());

    Result<> res = try_void_helper(true);

    expect(!res.has_value());
    expect(res.error().code == XtendErrorCode::IoError);
    expect(res.error().message == String("cannot write 'cache.txt'"));
  };

  "Plugin error family"_test = [] -> void {
    expect(IsPluginError(XtendErrorCode::PluginDisabled));
    expect(IsPluginError(XtendErrorCode::PluginInitFailed));
    expect(IsPluginError(XtendErrorCode::PluginLoadFailed));
    expect(IsPluginError(XtendErrorCode::PluginNotLoaded));
    expect(!IsPluginError(XtendErrorCode::Other));
    expect(!IsPluginError(XtendErrorCode::NotFound));
  };

  "Disabled error carries its reason"_test = [] -> void {
    const XtendError err = PluginDisabledError("acme.greeters", "hello", "Load condition for plugin was false");

    expect(err.code == XtendErrorCode::PluginDisabled);
    expect(err.message == String("plugin acme.greeters:hello is disabled, reason: Load condition for plugin was false"));
    expect(DisabledReason(err) == String("Load condition for plugin was false"));

    const XtendError bare(XtendErrorCode::PluginDisabled, "vetoed");
    expect(DisabledReason(bare) == String("vetoed"));
  };

  return 0;
}
