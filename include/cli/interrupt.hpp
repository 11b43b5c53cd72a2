#ifndef FILEWARDEN_CLI_INTERRUPT_HPP
#define FILEWARDEN_CLI_INTERRUPT_HPP

namespace filewarden {
namespace interrupt {

/**
 * Install the SIGINT handler
 *
 * The handler only raises the interrupt flag. It is installed without
 * SA_RESTART, so a prompt blocked in a read returns and the shell can shut
 * down cleanly.
 *
 * @return Whether the handler was installed
 */
bool install_handler();

// True once Ctrl+C was pressed
bool requested();

void set();
void clear();

} // namespace interrupt
} // namespace filewarden

#endif // FILEWARDEN_CLI_INTERRUPT_HPP
