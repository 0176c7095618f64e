#include <chrono>
#include <iostream>

#include "coaccess/stackless/async.hpp"
#include "coaccess/stackless/errors.hpp"
#include "coaccess/stackless/event_loop.hpp"
#include "coaccess/stackless/read_write_access.hpp"
#include "coaccess/stackless/timer.hpp"

using namespace std::chrono_literals;

using coaccess::AccessTimeoutError;
using coaccess::Async;
using coaccess::EventLoop;
using coaccess::ReadWriteAccess;
using coaccess::sleep_for;
using coaccess::spawn_task;

Async<void> slow_scan() {
    std::cout << "scan started\n";
    co_await sleep_for(300ms);
    std::cout << "scan finished\n";
}

Async<void> update() {
    std::cout << "update started\n";
    co_return;
}

Async<void> impatient_writer(ReadWriteAccess& access) {
    try {
        co_await access.write(update(), 100ms);
    } catch (const AccessTimeoutError& e) {
        std::cout << "writer gave up: " << e.what() << '\n';
    }
}

Async<void> patient_writer(ReadWriteAccess& access) {
    co_await access.write(update());
    std::cout << "patient writer got through\n";
}

int main() {
    ReadWriteAccess access(0ms);
    EventLoop loop;

    auto scan = spawn_task(access.read(slow_scan()), loop);
    auto impatient = spawn_task(impatient_writer(access), loop);
    auto patient = spawn_task(patient_writer(access), loop);
    loop.run();

    scan.get();
    impatient.get();
    patient.get();
    return 0;
}
