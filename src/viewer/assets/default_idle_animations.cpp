#include "viewer/assets/asset_catalog.h"

namespace CVW {
namespace Assets {

// Idle clip per model, keyed "alias/skinId", "alias" or "skinId".
const std::vector<std::pair<std::string, std::string>>& builtinIdleAnimations()
{
    static const std::vector<std::pair<std::string, std::string>> table = {
        {"aatrox", "Aatrox_Idle1"},
        {"ahri", "Idle1"},
        {"ahri/103089", "idle.SKINS_Ahri_Skin89"},
        {"akali", "Idle1"},
        {"akshan", "Idle1_Base"},
        {"alistar", "Idle1"},
        {"ambessa", "IdleBase"},
        {"amumu", "Idle1"},
        {"anivia", "Idle1"},
        {"annie", "Annie_2012_idle1.anm"},
        {"aphelios", "Idle1"},
        {"ashe", "Idle1"},
        {"aurelionsol", "Idle1_Base"},
        {"aurora", "Idle_Base"},
        {"azir", "Idle_Loop"},
        {"bard", "Idle1_Base"},
        {"belveth", "Idle1_Base"},
        {"blitzcrank", "Idle1"},
        {"brand", "Idle1"},
        {"braum", "Idle_01_Loop"},
        {"briar", "Idle1_Base"},
        {"caitlyn", "Idle1"},
        {"camille", "Idle_Loop"},
        {"cassiopeia", "Idle1"},
        {"chogath", "Idle1"},
        {"corki", "Idle1"},
        {"darius", "Idle1"},
        {"diana", "Idle1"},
        {"draven", "Idle1"},
        {"drmundo", "DrMundo_Idle02.anm"},
        {"ekko", "PunkGenius_Idle01.anm"},
        {"elise", "Elise_idle1.anm"},
        {"evelynn", "Idle1_Base"},
        {"ezreal", "Idle_Base"},
        {"fiddlesticks", "IdleA"},
        {"fiora", "Fiora_Idle1.anm"},
        {"fizz", "Idle1"},
        {"galio", "Idle1_Base"},
        {"gangplank", "Idle1"},
        {"garen", "Idle1_Base"},
        {"gnar", "Idle1_Base"},
        {"gragas", "Idle1"},
        {"graves", "Idle1"},
        {"gwen", "Idle.anm"},
        {"hecarim", "Hecarim_idle1.anm"},
        {"heimerdinger", "Idle1_Base"},
        {"hwei", "Idle1_Base"},
        {"illaoi", "Idle1_Base"},
        {"irelia", "Spell4_Idle"},
        {"ivern", "Idle1_Base"},
        {"janna", "Idle1"},
        {"jarvaniv", "Idle1"},
        {"jax", "Idle1_Base"},
        {"jayce", "jayce_melee_idle1.anm"},
        {"jhin", "Idle_Base"},
        {"jinx", "Idle1_Base"},
        {"kaisa", "Idle1_Base"},
        {"kalista", "Idle1_Base"},
        {"karma", "Idle1_Base"},
        {"karthus", "Idle1_Base"},
        {"kassadin", "Idle1"},
        {"katarina", "Idle1"},
        {"kayle", "Idle1_Base"},
        {"kayn", "Idle1_Base"},
        {"kennen", "Idle1"},
        {"khazix", "Khazix_idle1.anm"},
        {"kindred", "Idle_Base"},
        {"kled", "Idle0"},
        {"kogmaw", "Idle1"},
        {"ksante", "Idle1_Base"},
        {"leblanc", "Idle1"},
        {"leesin", "Idle_Active"},
        {"leona", "Idle1"},
        {"lillia", "Idle1_Base"},
        {"lissandra", "Idle1_Base"},
        {"lucian", "Idle1_Base"},
        {"lulu", "Lulu_Idle2.anm"},
        {"lux", "Idle1"},
        {"malphite", "Idle1"},
        {"malzahar", "Idle1"},
        {"maokai", "Idle1_Base"},
        {"masteryi", "masteryi_2013_idle1.anm"},
        {"mel", "Idle1"},
        {"milio", "Idle1_Base"},
        {"missfortune", "Idle1_Base"},
        {"monkeyking", "Idle1"},
        {"mordekaiser", "Idle.anm"},
        {"morgana", "Idle1"},
        {"naafiri", "Idle1_Base"},
        {"nami", "Idle1_Base"},
        {"nasus", "Idle1_Base"},
        {"nautilus", "Idle1"},
        {"neeko", "Idle1_Base"},
        {"nidalee", "nidalee_2012_idle1.anm"},
        {"nilah", "Idle1.anm"},
        {"nocturne", "Idle1"},
        {"nunu", "Idle_Base"},
        {"olaf", "Idle1"},
        {"orianna", "Idle1_Base"},
        {"ornn", "Idle1_Base"},
        {"pantheon", "Idle1"},
        {"poppy", "Idle1_Base"},
        {"pyke", "Idle1"},
        {"qiyana", "Qiyana_Base_Idle.anm"},
        {"quinn", "Idle1_Base"},
        {"rakan", "Idle1_Base"},
        {"rammus", "Idle1"},
        {"reksai", "Idle1_Base"},
        {"rell", "Idle.anm"},
        {"renata", "Idle1"},
        {"renekton", "Idle1"},
        {"rengar", "Idle1_Base"},
        {"riven", "Idle1"},
        {"rumble", "Idle1"},
        {"ryze", "Idle1"},
        {"samira", "Idle.anm"},
        {"sejuani", "Idle1"},
        {"senna", "Idle01"},
        {"seraphine", "Idle_Var1"},
        {"sett", "Idle_Base"},
        {"shaco", "Idle1"},
        {"shen", "Idle1"},
        {"shyvana", "Idle1"},
        {"singed", "Idle1"},
        {"sion", "Idle1_Base"},
        {"sivir", "Idle1_Base"},
        {"skarner", "IdleBase"},
        {"smolder", "Spell3_Idle"},
        {"sona", "Idle1"},
        {"soraka", "Idle1"},
        {"swain", "Idle_Loop"},
        {"sylas", "Spell4_Idle"},
        {"syndra", "Idle1"},
        {"tahmkench", "Idle1"},
        {"taliyah", "Idle1_Base"},
        {"talon", "Idle1"},
        {"taric", "Idle1_Base"},
        {"teemo", "Idle1_Base"},
        {"thresh", "Idle1_Base"},
        {"tristana", "Idle1_Base"},
        {"trundle", "trundle_2013_idle2.anm"},
        {"tryndamere", "Idle1"},
        {"twistedfate", "twistedfate_2012_idle1.anm"},
        {"twitch", "Idle1_Base"},
        {"udyr", "Idle1"},
        {"urgot", "Idle1_Base"},
        {"varus", "varus_idle1.anm"},
        {"vayne", "Idle1"},
        {"veigar", "Idle1"},
        {"velkoz", "Velkoz_Idle1v2.anm"},
        {"vex", "Idle_Loop"},
        {"vi", "Idle1_Base"},
        {"viego", "Idle1"},
        {"viktor", "Idle1"},
        {"vladimir", "Idle1"},
        {"volibear", "Idle_Base"},
        {"warwick", "Idle1_Base"},
        {"xayah", "Idle1_Base"},
        {"xerath", "Idle1"},
        {"xinzhao", "IdleBase"},
        {"yasuo", "Yasuo_Idle1.anm"},
        {"yone", "Idle1_Base"},
        {"yorick", "Idle1"},
        {"yunara", "Idle1"},
        {"yuumi", "Idle01"},
        {"zaahen", "IdleBase"},
        {"zac", "Idle2_Base"},
        {"zed", "Zed_idle1.anm"},
        {"zeri", "Idle_Base"},
        {"ziggs", "Ziggs_Idle1.anm"},
        {"zilean", "Idle1"},
        {"zoe", "Idle1_Base"},
        {"zyra", "Idle1"},
    };
    return table;
}

} // namespace Assets
} // namespace CVW
