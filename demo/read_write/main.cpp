#include <chrono>
#include <iostream>
#include <vector>

#include "coaccess/stackless/async.hpp"
#include "coaccess/stackless/event_loop.hpp"
#include "coaccess/stackless/read_write_access.hpp"
#include "coaccess/stackless/timer.hpp"

using namespace std::chrono_literals;

using coaccess::Async;
using coaccess::AsyncRO;
using coaccess::EventLoop;
using coaccess::ReadWriteAccess;
using coaccess::sleep_for;
using coaccess::spawn_task;

ReadWriteAccess coordinator;
int shared_value = 0;

Async<int> read_value(int x) {
    std::cout << "reader acquired access: " << x << '\n';
    co_await sleep_for(std::chrono::milliseconds(10 * x));
    std::cout << "reader done: " << x << " sees " << shared_value << '\n';
    co_return shared_value;
}

Async<void> write_value(int x) {
    std::cout << "writer acquired access: " << x << '\n';
    co_await sleep_for(std::chrono::milliseconds(10 * x));
    shared_value = x;
    std::cout << "writer done: " << x << '\n';
}

Async<void> reader(int x) {
    std::cout << "reader called: " << x << '\n';
    int value = co_await coordinator.read(read_value(x));
    std::cout << "reader return: " << x << " -> " << value << '\n';
}

Async<void> writer(int x) {
    std::cout << "writer called: " << x << '\n';
    co_await coordinator.write(write_value(x));
    std::cout << "writer return: " << x << '\n';
}

int main() {
    EventLoop loop;
    std::vector<AsyncRO<void>> tasks;
    tasks.push_back(spawn_task(reader(1), loop));
    tasks.push_back(spawn_task(reader(2), loop));
    tasks.push_back(spawn_task(writer(3), loop));
    tasks.push_back(spawn_task(reader(4), loop));
    tasks.push_back(spawn_task(reader(5), loop));
    tasks.push_back(spawn_task(writer(6), loop));
    tasks.push_back(spawn_task(reader(7), loop));
    tasks.push_back(spawn_task(reader(8), loop));
    loop.run();

    for (auto& task : tasks) {
        task.get();
    }
    std::cout << "final value: " << shared_value << '\n';
    return 0;
}
