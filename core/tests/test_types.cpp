#include <boost/ut.hpp>

#include <Xtend++/Utils/Error.hpp>
#include <Xtend++/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace xtend::utils::types;

  "Type sizes"_test = [] -> void {
    expect(sizeof(u8) == 1_ul);
    expect(sizeof(u16) == 2_ul);
    expect(sizeof(u32) == 4_ul);
    expect(sizeof(u64) == 8_ul);
    expect(sizeof(i8) == 1_ul);
    expect(sizeof(i16) == 2_ul);
    expect(sizeof(i32) == 4_ul);
    expect(sizeof(i64) == 8_ul);
    expect(sizeof(f32) == 4_ul);
    expect(sizeof(f64) == 8_ul);
  };

  "Option helper Some"_test = [] -> void {
    Option<i32> opt = Some(42);

    expect(opt.has_value());
    expect(*opt == 42);

    Option<String> optStr = Some(String("test"));

    expect(optStr.has_value());
    expect(*optStr == String("test"));
  };

  "Result error"_test = [] -> void {
    using namespace xtend::utils::error;

    Result<i32> res = Err(XtendError(XtendErrorCode::NotFound, "test error"));

    expect(!res.has_value());
    expect(res.error().code == XtendErrorCode::NotFound);
    expect(res.error().message == String("test error"));
  };

  "Map finds String keys by StringView"_test = [] -> void {
    Map<String, i32> map { { "alpha", 1 }, { "beta", 2 } };

    constexpr StringView key = "beta";

    expect(map.find(key) != map.end());
    expect(map.find(key)->second == 2);
    expect(map.begin()->first == String("alpha"));
  };

  "UnorderedMap keeps insertion order"_test = [] -> void {
    UnorderedMap<String, usize> positions;
    positions.emplace("zeta", 0);
    positions.emplace("alpha", 1);

    expect(positions.contains("zeta"));
    expect(positions.begin()->first == String("zeta"));
  };

  return 0;
}
