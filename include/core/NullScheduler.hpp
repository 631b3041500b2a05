// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#ifndef NULL_SCHEDULER_HPP
#define NULL_SCHEDULER_HPP

namespace Gossamer::Core {

    /**
     * @brief A NULL sink implementációja.
     * Nem büntet, nem riaszt, nem blokkol: egyszerűen elnyel.
     */
    class NullScheduler {
    public:
        /**
         * @brief Befogadja a dekódolhatatlan frame-et, de megszakítja a láncot.
         */
        template<typename T>
        static void absorb(const T& data) {
            // Nem naplózunk frame-enként, hogy a zaj ne árassza el a logot.
            // Csak a busz telemetriája számol.
            (void)data;
        }
    };
}

#endif
