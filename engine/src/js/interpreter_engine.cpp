#include "js/interpreter_engine.h"

#include <chrono>
#include <cstdint>
#include <string>

extern "C" {
#include "quickjs.h"
}

#include "js/interrupt_controller.h"

namespace script_runner {

namespace {

constexpr const char* kScriptFilename = "<script>";
constexpr const char* kOutOfMemoryMessage = "Uncaught InternalError: out of memory";

// State shared with the interrupt handler
struct CheckpointState {
  const InterruptToken* timer_token;
  const InterruptToken* external_token;
  int64_t checkpoints;
  bool interrupted;
};

// Interrupt handler: QuickJS polls this between bytecode steps
int JsInterruptHandler(JSRuntime* rt, void* opaque) {
  auto* state = static_cast<CheckpointState*>(opaque);
  state->checkpoints++;
  if (state->timer_token->IsRequested() ||
      (state->external_token && state->external_token->IsRequested())) {
    state->interrupted = true;
    return 1;  // Signal interrupt
  }
  return 0;
}

// Owns one runtime/context pair for the duration of a call
struct VmInstance {
  JSRuntime* rt = nullptr;
  JSContext* ctx = nullptr;

  VmInstance() {
    rt = JS_NewRuntime();
    if (rt) {
      ctx = JS_NewContext(rt);
    }
  }

  ~VmInstance() {
    if (ctx) JS_FreeContext(ctx);
    if (rt) JS_FreeRuntime(rt);
  }

  VmInstance(const VmInstance&) = delete;
  VmInstance& operator=(const VmInstance&) = delete;
};

// Get string from JS value; false if conversion itself failed
bool JsGetString(JSContext* ctx, JSValueConst val, std::string* out) {
  const char* str = JS_ToCString(ctx, val);
  if (!str) return false;
  out->assign(str);
  JS_FreeCString(ctx, str);
  return true;
}

// Heap allowance on top of the script's cap while its exception is formatted
constexpr size_t kDescribeHeadroomBytes = 1024 * 1024;

// typeof-style name for values whose string conversion failed
const char* JsTypeName(JSValueConst val) {
  if (JS_IsSymbol(val)) return "symbol";
  if (JS_IsObject(val)) return "object";
  if (JS_IsString(val)) return "string";
  if (JS_IsNumber(val)) return "number";
  if (JS_IsBool(val)) return "boolean";
  if (JS_IsUndefined(val)) return "undefined";
  return "value";
}

// Describe the pending exception as "Uncaught <Error>: <message>".
// Converting a thrown object runs its toString(), so the caller keeps the
// timer armed; the heap cap only grows by a fixed headroom.
std::string DescribePendingException(JSRuntime* rt, JSContext* ctx, size_t heap_limit) {
  JS_RunGC(rt);
  size_t raised = heap_limit > SIZE_MAX - kDescribeHeadroomBytes
                      ? SIZE_MAX
                      : heap_limit + kDescribeHeadroomBytes;
  JS_SetMemoryLimit(rt, raised);

  JSValue exc = JS_GetException(ctx);
  if (JS_IsNull(exc)) {
    // QuickJS throws null when it cannot even allocate the error object
    return kOutOfMemoryMessage;
  }

  std::string text;
  if (JsGetString(ctx, exc, &text)) {
    JS_FreeValue(ctx, exc);
    return "Uncaught " + text;
  }

  // The conversion itself threw: out of memory, or a value like a Symbol
  JSValue nested = JS_GetException(ctx);
  std::string nested_text;
  bool out_of_memory = true;
  if (!JS_IsNull(nested)) {
    if (JsGetString(ctx, nested, &nested_text)) {
      out_of_memory = nested_text == "InternalError: out of memory";
    } else {
      JS_FreeValue(ctx, JS_GetException(ctx));
    }
  }
  JS_FreeValue(ctx, nested);
  std::string description = out_of_memory ? std::string(kOutOfMemoryMessage)
                                          : std::string("Uncaught ") + JsTypeName(exc);
  JS_FreeValue(ctx, exc);
  return description;
}

}  // namespace

ExecutionOutcome InterpreterEngine::Execute(const std::string& script,
                                            const ResourceLimits& limits,
                                            InterruptToken* external) const {
  // Create a fresh runtime/context for this execution
  VmInstance vm;
  if (!vm.rt || !vm.ctx) {
    return KillError{"failed to create interpreter instance"};
  }

  JS_SetMaxStackSize(vm.rt, kMaxStackBytes);
  JS_SetMemoryLimit(vm.rt, static_cast<size_t>(limits.max_heap_size_bytes));

  InterruptToken timer_token;
  CheckpointState state{&timer_token, external, 0, false};
  JS_SetInterruptHandler(vm.rt, JsInterruptHandler, &state);

  // Stays armed through stringification: toString() is script code too
  InterruptController controller;
  controller.Arm(timer_token, std::chrono::milliseconds(limits.max_execution_time_ms));

  // JS_Eval requires a NUL-terminated buffer; std::string provides one
  JSValue value = JS_Eval(vm.ctx, script.c_str(), script.size(), kScriptFilename,
                          JS_EVAL_TYPE_GLOBAL);

  std::string text;
  bool failed = JS_IsException(value);
  if (!failed) {
    failed = !JsGetString(vm.ctx, value, &text);
  }
  JS_FreeValue(vm.ctx, value);

  // Still armed: describing a thrown object runs script code as well
  std::string error_text;
  if (failed && !state.interrupted) {
    error_text = DescribePendingException(
        vm.rt, vm.ctx, static_cast<size_t>(limits.max_heap_size_bytes));
  }

  controller.Disarm();

  // Check for interrupt
  if (state.interrupted) {
    JS_FreeValue(vm.ctx, JS_GetException(vm.ctx));
    return Timeout{};
  }

  if (failed) {
    return RuntimeError{std::move(error_text)};
  }

  return Success{std::move(text)};
}

}  // namespace script_runner
