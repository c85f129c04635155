#pragma once

#include <stdint.h>
#include <stddef.h>

#include <type_traits>
#include <utility>

namespace format
{
	template<typename OutputIt>
	struct format_output_it {
		format_output_it(OutputIt& it): it{it} {}

		void write(const char* str){
			while(*str)
				it.putc(*str++);
		}

		void write(const char c){
			it.putc(c);
		}

		void flush(){
			it.flush();
		}

		private:
		OutputIt& it;
	};

	struct format_args {
		char align = ' ', sign = ' ';
		bool alternate = false;
		char type = ' ';
	};

	namespace internal {
		inline char* format_number(uint64_t value, bool negative, char* str, int base, bool capital){
			if(base < 2 || base > 36){
				*str = '\0';
				return str;
			}

			char* rc = str, *ptr = str;

			if(negative){
				value = ~value + 1;
				*ptr++ = '-';
			}

			char* low = ptr;

			do {
				const char* lower_case = "0123456789abcdefghijklmnopqrstuvwxyz";
				const char* upper_case = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
				const char* digits = capital ? upper_case : lower_case;

				*ptr++ = digits[value % base];
				value /= base;
			} while (value);

			*ptr-- = '\0';

			while(low < ptr){
				char tmp = *low;
				*low++ = *ptr;
				*ptr-- = tmp;
			}
			return rc;
		}

		template<typename OutputIt, typename T>
		void format_integer(format_output_it<OutputIt>& out, format_args args, T v){
			if(args.type == ' ')
				args.type = 'd';

			int base = 10;
			bool capital = false;
			const char* base_prefix = "";

			switch (args.type)
			{
			// Type options
			case 'b': // Binary
				base = 2;
				base_prefix = "0b";
				break;
			case 'B':
				base = 2;
				base_prefix = "0B";
				break;
			case 'o': // Octal
				base = 8;
				base_prefix = "0";
				break;
			case 'x': // Hex, lowercase
				base = 16;
				base_prefix = "0x";
				break;
			case 'X': // Hex, uppercase
				base = 16;
				base_prefix = "0X";
				capital = true;
				break;
			default: // Decimal
				break;
			}

			if(args.alternate)
				out.write(base_prefix);

			bool negative = false;
			if constexpr (std::is_signed_v<T>)
				negative = (v < 0) && base == 10;

			// Other bases print the bits of T, not of its sign extension
			uint64_t value = negative ? (uint64_t)(int64_t)v : (uint64_t)(std::make_unsigned_t<T>)v;

			char int_buf[72]{};
			format_number(value, negative, int_buf, base, capital);
			out.write(int_buf);
		}
	}

	template<typename T>
	struct formatter;

	template<>
	struct formatter<const char*> {
		template<typename OutputIt>
		static void format(format_output_it<OutputIt>& it, [[maybe_unused]] format_args args, const char* item){
			it.write(item ? item : "(null)");
		}
	};

	template<>
	struct formatter<char*> {
		template<typename OutputIt>
		static void format(format_output_it<OutputIt>& it, format_args args, char* item){
			formatter<const char*>::format(it, args, item);
		}
	};

	#define INT_IMPL(T) \
		template<> \
		struct formatter<T> { \
			template<typename OutputIt> \
			static void format(format_output_it<OutputIt>& it, format_args args, T item){ \
				internal::format_integer(it, args, item); \
			} \
		};

	INT_IMPL(signed char)
	INT_IMPL(unsigned char)

	INT_IMPL(short int)
	INT_IMPL(unsigned short int)

	INT_IMPL(int)
	INT_IMPL(unsigned int)

	INT_IMPL(long int)
	INT_IMPL(unsigned long int)

	INT_IMPL(long long int)
	INT_IMPL(unsigned long long int)

	#undef INT_IMPL

	template<>
	struct formatter<char> {
		template<typename OutputIt>
		static void format(format_output_it<OutputIt>& it, format_args args, char item){
			if(args.type == ' ')
				args.type = 'c';

			if(args.type == 'c')
				it.write(item);
			else
				formatter<unsigned char>::format(it, args, (unsigned char)item);
		}
	};

	template<>
	struct formatter<bool> {
		template<typename OutputIt>
		static void format(format_output_it<OutputIt>& it, format_args args, bool item){
			if(args.type == ' ')
				args.type = 's'; // Textual is default

			switch (args.type)
			{
			case 'd':
				it.write(item ? "1" : "0");
				break;
			default:
				it.write(item ? "true" : "false");
				break;
			}
		}
	};

	template<>
	struct formatter<void*> {
		template<typename OutputIt>
		static void format(format_output_it<OutputIt>& it, [[maybe_unused]] format_args args, void* item){
			formatter<uintptr_t>::format(it, {.alternate = true, .type = 'x'}, (uintptr_t)item); // Default is 0xYYYYYYYYYYYYYYYY where Y is the pointer
		}
	};

	template<typename OutputIt, typename T>
	concept Printable = requires(format_output_it<OutputIt>& it, T t, format_args args) {
		{ formatter<T>::format(it, args, t) };
	};

	namespace internal {
		enum class scan_result { placeholder, end, error };

		// Copies literal text to out until the next placeholder, whose options are parsed into args
		template<typename OutputIt>
		scan_result scan(format_output_it<OutputIt>& out, const char*& fmt, format_args& args){
			while(*fmt){
				if(fmt[0] == '{' && fmt[1] == '{'){
					out.write('{');
					fmt += 2;
				} else if(fmt[0] == '}' && fmt[1] == '}') {
					out.write('}');
					fmt += 2;
				} else if(*fmt == '}') {
					return scan_result::error;
				} else if(*fmt == '{'){
					fmt++;

					args = {};
					while(*fmt != '}'){
						if(*fmt == '\0' || *fmt == '{')
							return scan_result::error;

						if(*fmt == 'b' || *fmt == 'B' || *fmt == 'c' || *fmt == 'd' || *fmt == 'o' || *fmt == 'p' || *fmt == 's' || *fmt == 'x' || *fmt == 'X') // Type
							args.type = *fmt;
						else if(*fmt == '<' || *fmt == '>' || *fmt == '^') // Align
							args.align = *fmt;
						else if(*fmt == '+' || *fmt == '-' || *fmt == ' ') // Sign
							args.sign = *fmt;
						else if(*fmt == '#')
							args.alternate = true;

						fmt++;
					}

					fmt++; // Skip final '}'
					return scan_result::placeholder;
				} else {
					out.write(*fmt);
					fmt++;
				}
			}

			return scan_result::end;
		}

		template<typename OutputIt>
		bool format_int(format_output_it<OutputIt>& out, const char* fmt){
			format_args args{};
			return scan(out, fmt, args) == scan_result::end; // A placeholder here has no argument left
		}

		template<typename OutputIt, typename T, typename... Args> requires Printable<OutputIt, std::decay_t<T>>
		bool format_int(format_output_it<OutputIt>& out, const char* fmt, T&& v, Args&&... args){
			format_args f_args{};
			if(scan(out, fmt, f_args) != scan_result::placeholder)
				return false;

			formatter<std::decay_t<T>>::format(out, f_args, v);
			return format_int(out, fmt, std::forward<Args>(args)...);
		}
	} // namespace internal

	// Returns false if fmt is malformed or does not consume exactly the given arguments
	template<typename OutputIt, typename... Args>
	bool format_to(OutputIt& out, const char* fmt, Args&&... args){
		format_output_it<OutputIt> it{out};

		bool ok = internal::format_int(it, fmt, std::forward<Args>(args)...);
		it.flush();
		return ok;
	}
} // namespace format
