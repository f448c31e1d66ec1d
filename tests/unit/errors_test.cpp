#include "internal/util/errors.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

namespace {

using stowage::util::ErrorCode;
using stowage::util::Status;
using stowage::util::StatusOr;

Status FailWhen(bool fail) {
  if (fail) return Status::Err(ErrorCode::NotFound, "missing");
  return Status::Ok();
}

Status Chain(bool fail) {
  STOWAGE_RETURN_IF_ERROR(FailWhen(fail));
  return Status::Err(ErrorCode::Internal, "reached end");
}

void TestStatusBasics() {
  auto ok = Status::Ok();
  assert(ok.ok());
  assert(static_cast<bool>(ok));

  auto err = Status::Err(ErrorCode::LockTimeout, "busy");
  assert(!err.ok());
  assert(err.ToString().find("busy") != std::string::npos);
  assert(ToString(ErrorCode::VersionConflict) == "VersionConflict");
}

void TestOnlyTransientIsRetryable() {
  assert(stowage::util::IsTransient(ErrorCode::Transient));
  assert(!stowage::util::IsTransient(ErrorCode::InvalidChunkSize));
  assert(!stowage::util::IsTransient(ErrorCode::IncompletePartsError));
  assert(!stowage::util::IsTransient(ErrorCode::NotFound));
}

void TestStatusOrFromOkStatusIsInternal() {
  StatusOr<int> result(Status::Ok());
  assert(!result.ok());
  assert(result.code() == ErrorCode::Internal);
}

void TestStatusOrHoldsMoveOnlyValues() {
  StatusOr<std::unique_ptr<int>> result(std::make_unique<int>(7));
  assert(result.ok());
  auto owned = std::move(result).value();
  assert(*owned == 7);
}

void TestReturnIfErrorPropagates() {
  assert(Chain(true).code == ErrorCode::NotFound);
  assert(Chain(false).code == ErrorCode::Internal);
}

} // namespace

int main() {
  TestStatusBasics();
  TestOnlyTransientIsRetryable();
  TestStatusOrFromOkStatusIsInternal();
  TestStatusOrHoldsMoveOnlyValues();
  TestReturnIfErrorPropagates();

  std::cout << "stowage_unit_errors: pass\n";
  return 0;
}
