#pragma once

#include <Lumen/common.hpp>
#include <Lumen/misc/format.hpp>
#include <Lumen/cpu/mutex.hpp>

#include <stdx/mutex.hpp>

namespace klog
{
	struct Logger {
		virtual ~Logger() {}

		virtual void putc(const char c) = 0;
		virtual void flush() {}
	};

	extern Logger* global_logger;
	// Interrupts stay enabled while it is held, an IRQ handler that prints on the owning CPU spins forever
	extern TicketLock global_lock;

	enum class LoggerType { Vga, Debug };
	void select_logger(LoggerType type);

	// Current sink, the VGA console is bound on first use. global_lock must be held
	Logger& current_logger();

	namespace internal {
		template<typename... Args>
		void print(bool newline, const char* fmt, Args&&... args){
			bool ok;
			{
				stdx::lock_guard guard{global_lock};

				auto& logger = current_logger();
				ok = format::format_to(logger, fmt, std::forward<Args>(args)...);
				if(ok && newline) {
					logger.putc('\n');
					logger.flush();
				}
			}

			// Outside the lock, panic() prints too
			if(!ok)
				PANIC("print: invalid format string");
		}
	} // namespace internal
} // namespace klog


template<typename... Args>
void print(const char* fmt, Args&&... args){
	klog::internal::print(false, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void println(const char* fmt, Args&&... args){
	klog::internal::print(true, fmt, std::forward<Args>(args)...);
}

inline void println(){
	print("\n");
}
