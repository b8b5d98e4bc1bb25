#include <arbiter/errors.h>

bool IsRetryable(const std::exception& err) {
  if (auto ptr = dynamic_cast<const JudgeError*>(&err)) return ptr->Retryable();
  return true;
}
