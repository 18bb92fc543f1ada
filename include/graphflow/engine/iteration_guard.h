// graphflow/engine/iteration_guard.h
#ifndef GRAPHFLOW_ENGINE_ITERATION_GUARD_H
#define GRAPHFLOW_ENGINE_ITERATION_GUARD_H

namespace graphflow {

// Fixed ceiling on node executions per invocation.
inline constexpr int MAX_ITERATIONS = 100;

// 每次调用独占一个计数器
class IterationGuard {
public:
    explicit IterationGuard(int max_iterations = MAX_ITERATIONS) : max_iterations_(max_iterations) {}

    // 尝试消耗一次节点执行；达到上限返回 false
    bool try_consume_node() {
        if (used_ >= max_iterations_) return false;
        ++used_;
        return true;
    }

    bool exhausted() const { return used_ >= max_iterations_; }
    int used() const { return used_; }
    int limit() const { return max_iterations_; }

private:
    int max_iterations_;
    int used_ = 0;
};

} // namespace graphflow

#endif // GRAPHFLOW_ENGINE_ITERATION_GUARD_H
