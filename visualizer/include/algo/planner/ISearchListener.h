#pragma once


namespace pathviz {
namespace algo {
namespace planner{

/*
搜索进度的观察者 : 搜索引擎只通过这个接口向外通知, 不依赖任何绘图库
两个回调都在搜索线程上同步执行
*/
class ISearchListener {
public:
    virtual ~ISearchListener() = default;

    // 每扩展一个格子调用一次; 路径回溯时每标记一个 PATH 格子调用一次
    virtual void OnStep() = 0;

    // 每轮外层循环轮询一次, 返回 true 则搜索立即中止
    virtual bool ShouldAbort() { return false; }
};

}
}
}
