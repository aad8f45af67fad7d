#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "cmd/imgvarctl/args.hpp"

namespace {

using namespace imgvar::v1;

template <typename Fn>
bool Rejects(Fn&& fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestIdsMustBeWholeNumbers() {
  assert(imgvar::cli::ParseId("12") == 12);
  assert(imgvar::cli::ParseId("9000000000") == 9000000000LL);

  assert(Rejects([] { (void)imgvar::cli::ParseId("12abc"); }));
  assert(Rejects([] { (void)imgvar::cli::ParseId(""); }));
  assert(Rejects([] { (void)imgvar::cli::ParseId(" 12"); }));
  assert(Rejects([] { (void)imgvar::cli::ParseId("abc"); }));
  assert(Rejects([] { (void)imgvar::cli::ParseId("99999999999999999999"); }));
}

void TestDimensions() {
  assert(imgvar::cli::ParseDimension("640") == 640);
  assert(imgvar::cli::ParseDimension("-5") == -5);

  assert(Rejects([] { (void)imgvar::cli::ParseDimension("640px"); }));
  assert(Rejects([] { (void)imgvar::cli::ParseDimension("4294967296"); }));
}

void TestFormats() {
  assert(imgvar::cli::ParseFormat("png") == IMAGE_FORMAT_PNG);
  assert(imgvar::cli::ParseFormat(".JPG") == IMAGE_FORMAT_JPEG);
  assert(imgvar::cli::ParseFormat("jpeg") == IMAGE_FORMAT_JPEG);
  assert(imgvar::cli::ParseFormat("gif") == IMAGE_FORMAT_GIF);
  assert(!imgvar::cli::ParseFormat("bmp").has_value());
}

} // namespace

int main() {
  TestIdsMustBeWholeNumbers();
  TestDimensions();
  TestFormats();

  std::cout << "imgvar_unit_imgvarctl_args: pass\n";
  return 0;
}
