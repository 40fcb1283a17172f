#ifndef PARLEY_ID_GENERATOR_HPP
#define PARLEY_ID_GENERATOR_HPP

#include <string>

namespace parley {

namespace IdGenerator {

    /**
     * Random (version 4) UUID in canonical 8-4-4-4-12 form.
     * Used for room ids, session ids and chat message ids.
     */
    std::string generate();

} // namespace IdGenerator

} // namespace parley

#endif // PARLEY_ID_GENERATOR_HPP
